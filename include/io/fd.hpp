#pragma once

namespace uplink {

// Owning POSIX file descriptor.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    int Release();

    // Closes now and reports close(2) failure, which matters for writes.
    int Close();

  private:
    int fd_{-1};
};

} // namespace uplink
