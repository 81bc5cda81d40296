// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stream/InputSource.hpp>

namespace tfview
{

/// @brief Read-only input source over an existing file descriptor (a pipe or a file).
class FdInputSource: public InputSource
{
  public:
    /// @param fd The descriptor to read from.
    /// @param ownsFd Whether close() and the destructor close @p fd.
    explicit FdInputSource(int fd, bool ownsFd = false);
    ~FdInputSource() override;

    FdInputSource(FdInputSource const&) = delete;
    auto operator=(FdInputSource const&) -> FdInputSource& = delete;

    [[nodiscard]] auto read(std::span<char> buffer, std::chrono::milliseconds timeout)
        -> Result<ReadResult> override;
    [[nodiscard]] auto write(std::string_view data) -> VoidResult override;
    void close() override;
    [[nodiscard]] auto isInteractive() const noexcept -> bool override { return false; }

  private:
    int _fd;
    bool _ownsFd;
};

} // namespace tfview
