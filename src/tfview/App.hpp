// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tfview/Config.hpp>

#include <memory>
#include <string>
#include <vector>

namespace tfview
{

/// @brief Wires the input source, the reader thread, the view model and the terminal together.
///
/// With an empty @p command the plan is read from stdin (pipe mode). Otherwise the command
/// is started under a pseudo-terminal and the user can answer its prompts.
class App
{
  public:
    App(ViewerConfig config, std::vector<std::string> command);
    ~App();

    App(App const&) = delete;
    auto operator=(App const&) -> App& = delete;

    /// @brief Runs the full-screen viewer until the user quits.
    /// @return Process exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace tfview
