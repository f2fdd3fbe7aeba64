#pragma once

namespace nimage {

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
    // Gives up ownership without closing.
    int Release();
    // Closes and reports the close() result; a failed close after write can mean lost data.
    bool CloseChecked();
    void Close();

  private:
    int fd_{-1};
};

} // namespace nimage
