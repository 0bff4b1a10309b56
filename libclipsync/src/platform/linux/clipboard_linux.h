/**
 * @file clipboard_linux.h
 * @brief Linux clipboard backend built on the wl-clipboard / xclip tools
 */

#ifndef CLIPSYNC_PLATFORM_LINUX_CLIPBOARD_LINUX_H
#define CLIPSYNC_PLATFORM_LINUX_CLIPBOARD_LINUX_H

#include "clipsync/clipboard.h"
#include "clipsync/error.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace clipsync {
namespace platform {

/**
 * @brief Display server of the current session
 */
enum class DisplayServer { Unknown, X11, Wayland };

/**
 * @brief Detect the current display server from the environment
 */
DisplayServer detect_display_server();

/**
 * @brief Output and exit status of a finished command
 */
struct CommandOutput {
  Bytes output;
  int exit_code = -1;
};

/**
 * @brief Run a shell command and capture stdout (binary safe)
 */
Result<CommandOutput> execute_command(const std::string &cmd);

/**
 * @brief Run a shell command feeding @p input on stdin
 */
Result<void> execute_command_with_input(const std::string &cmd,
                                        const Byte *input, size_t size);

/**
 * @brief Check if a command exists on PATH
 */
bool command_exists(const char *cmd);

/**
 * @brief Split a MIME target listing into trimmed non-empty lines
 */
std::vector<std::string> split_targets(const Bytes &listing);

/**
 * @brief Classify a MIME target list (plain text wins over PNG)
 */
ClipboardContentType classify_targets(const std::vector<std::string> &targets);

/**
 * @brief ClipboardBackend that shells out to the desktop clipboard tools
 *
 * Tool invocations are serialized with a mutex.
 */
class SystemClipboard : public ClipboardBackend {
public:
  static Result<std::unique_ptr<SystemClipboard>> create();

  Result<ClipboardContentType> classify() override;
  Result<std::string> read_text() override;
  Result<void> write_text(const std::string &text) override;
  Result<std::optional<ImageData>> read_image() override;
  Result<void> write_image(const ImageData &image) override;

  DisplayServer display_server() const { return server_; }

private:
  SystemClipboard(DisplayServer server, bool has_xclip);

  DisplayServer server_;
  bool has_xclip_; // X11 only; xsel otherwise (text only)
  std::mutex mutex_;
};

} // namespace platform
} // namespace clipsync

#endif // CLIPSYNC_PLATFORM_LINUX_CLIPBOARD_LINUX_H
