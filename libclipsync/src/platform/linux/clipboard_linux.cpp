/**
 * @file clipboard_linux.cpp
 * @brief Linux clipboard implementation
 *
 * Implements clipboard access using command-line tools (wl-paste/wl-copy,
 * xclip, xsel) for maximum compatibility across different Linux
 * environments.
 */

#include "clipboard_linux.h"
#include <array>
#include <cstdio>
#include <cstdlib>
#include <sys/wait.h>

namespace clipsync {
namespace platform {

// ============================================================================
// Display Server Detection
// ============================================================================

DisplayServer detect_display_server() {
  // Check for Wayland
  const char *wayland = std::getenv("WAYLAND_DISPLAY");
  if (wayland && wayland[0] != '\0') {
    return DisplayServer::Wayland;
  }

  // Check for X11
  const char *display = std::getenv("DISPLAY");
  if (display && display[0] != '\0') {
    return DisplayServer::X11;
  }

  return DisplayServer::Unknown;
}

// ============================================================================
// Command Execution Helpers
// ============================================================================

namespace {

int exit_status(int raw) {
  if (raw == -1) {
    return -1;
  }
  return WIFEXITED(raw) ? WEXITSTATUS(raw) : -1;
}

} // namespace

Result<CommandOutput> execute_command(const std::string &cmd) {
  FILE *pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    return Error(ErrorCode::ClipboardAccessError,
                 "Failed to execute command: " + cmd);
  }

  // fread, not fgets: image data contains NUL bytes
  CommandOutput result;
  std::array<Byte, 8192> buffer;
  size_t n;
  while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
    result.output.insert(result.output.end(), buffer.begin(),
                         buffer.begin() + n);
  }

  result.exit_code = exit_status(pclose(pipe));
  return result;
}

Result<void> execute_command_with_input(const std::string &cmd,
                                        const Byte *input, size_t size) {
  FILE *pipe = popen(cmd.c_str(), "w");
  if (!pipe) {
    return Error(ErrorCode::ClipboardAccessError,
                 "Failed to execute command: " + cmd);
  }

  bool written = fwrite(input, 1, size, pipe) == size;
  int status = exit_status(pclose(pipe));

  if (!written) {
    return Error(ErrorCode::ClipboardAccessError, "Failed to write to pipe",
                 cmd);
  }
  if (status != 0) {
    return Error(ErrorCode::ClipboardAccessError, "Clipboard tool failed",
                 cmd + " exited with " + std::to_string(status));
  }
  return Result<void>::ok();
}

bool command_exists(const char *cmd) {
  std::string check = "command -v ";
  check += cmd;
  check += " >/dev/null 2>&1";
  return system(check.c_str()) == 0;
}

// ============================================================================
// Target Classification
// ============================================================================

std::vector<std::string> split_targets(const Bytes &listing) {
  std::vector<std::string> targets;
  std::string line;
  for (Byte b : listing) {
    if (b == '\n') {
      if (!line.empty()) {
        targets.push_back(line);
      }
      line.clear();
    } else if (b != '\r' && b != ' ' && b != '\t') {
      line.push_back(static_cast<char>(b));
    }
  }
  if (!line.empty()) {
    targets.push_back(line);
  }
  return targets;
}

ClipboardContentType
classify_targets(const std::vector<std::string> &targets) {
  bool has_text = false;
  bool has_png = false;

  for (const auto &t : targets) {
    if (t.compare(0, 10, "text/plain") == 0 || t == "UTF8_STRING" ||
        t == "STRING" || t == "TEXT") {
      has_text = true;
    } else if (t == "image/png") {
      has_png = true;
    }
  }

  // Office suites offer a PNG rendering alongside copied text
  if (has_text) {
    return ClipboardContentType::Text;
  }
  if (has_png) {
    return ClipboardContentType::Image;
  }
  return ClipboardContentType::Empty;
}

// ============================================================================
// SystemClipboard
// ============================================================================

Result<std::unique_ptr<SystemClipboard>> SystemClipboard::create() {
  auto server = detect_display_server();

  if (server == DisplayServer::Wayland) {
    if (!command_exists("wl-paste") || !command_exists("wl-copy")) {
      return Error(ErrorCode::ClipboardToolMissing,
                   "wl-paste/wl-copy not found. Install wl-clipboard package.");
    }
    return std::unique_ptr<SystemClipboard>(
        new SystemClipboard(server, false));
  }

  if (server == DisplayServer::X11) {
    bool has_xclip = command_exists("xclip");
    if (!has_xclip && !command_exists("xsel")) {
      return Error(ErrorCode::ClipboardToolMissing,
                   "xclip or xsel not found. Install one of them.");
    }
    return std::unique_ptr<SystemClipboard>(
        new SystemClipboard(server, has_xclip));
  }

  return Error(ErrorCode::NotSupported,
               "No display server detected (headless mode?)");
}

SystemClipboard::SystemClipboard(DisplayServer server, bool has_xclip)
    : server_(server), has_xclip_(has_xclip) {}

Result<ClipboardContentType> SystemClipboard::classify() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::string cmd;
  if (server_ == DisplayServer::Wayland) {
    cmd = "wl-paste --list-types 2>/dev/null";
  } else if (has_xclip_) {
    cmd = "xclip -selection clipboard -o -t TARGETS 2>/dev/null";
  } else {
    // xsel cannot list targets; anything readable counts as text
    auto out = execute_command("xsel --clipboard --output 2>/dev/null");
    if (out.is_error()) {
      return out.error();
    }
    return out.value().output.empty() ? ClipboardContentType::Empty
                                      : ClipboardContentType::Text;
  }

  auto out = execute_command(cmd);
  if (out.is_error()) {
    return out.error();
  }
  // Both tools exit non-zero when nothing is copied
  if (out.value().exit_code != 0) {
    return ClipboardContentType::Empty;
  }
  return classify_targets(split_targets(out.value().output));
}

Result<std::string> SystemClipboard::read_text() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::string cmd;
  if (server_ == DisplayServer::Wayland) {
    cmd = "wl-paste --no-newline --type text 2>/dev/null";
  } else if (has_xclip_) {
    cmd = "xclip -selection clipboard -o -t UTF8_STRING 2>/dev/null";
  } else {
    cmd = "xsel --clipboard --output 2>/dev/null";
  }

  auto out = execute_command(cmd);
  if (out.is_error()) {
    return out.error();
  }
  const Bytes &bytes = out.value().output;
  return std::string(bytes.begin(), bytes.end());
}

Result<void> SystemClipboard::write_text(const std::string &text) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::string cmd;
  if (server_ == DisplayServer::Wayland) {
    cmd = "wl-copy 2>/dev/null";
  } else if (has_xclip_) {
    cmd = "xclip -selection clipboard 2>/dev/null";
  } else {
    cmd = "xsel --clipboard --input 2>/dev/null";
  }

  return execute_command_with_input(
      cmd, reinterpret_cast<const Byte *>(text.data()), text.size());
}

Result<std::optional<ImageData>> SystemClipboard::read_image() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::string cmd;
  if (server_ == DisplayServer::Wayland) {
    cmd = "wl-paste --type image/png 2>/dev/null";
  } else if (has_xclip_) {
    cmd = "xclip -selection clipboard -t image/png -o 2>/dev/null";
  } else {
    return Error(ErrorCode::ClipboardToolMissing,
                 "xsel cannot read images. Install xclip.");
  }

  auto out = execute_command(cmd);
  if (out.is_error()) {
    return out.error();
  }
  if (out.value().exit_code != 0 || out.value().output.empty()) {
    return std::optional<ImageData>();
  }

  ImageData image;
  image.data = std::move(out.value().output);
  auto dims = png_dimensions(image.data);
  if (dims.is_error()) {
    return Error(ErrorCode::ClipboardAccessError,
                 "Clipboard image is not a valid PNG", dims.error().message);
  }
  image.width = dims.value().first;
  image.height = dims.value().second;
  return std::optional<ImageData>(std::move(image));
}

Result<void> SystemClipboard::write_image(const ImageData &image) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::string cmd;
  if (server_ == DisplayServer::Wayland) {
    cmd = "wl-copy --type image/png 2>/dev/null";
  } else if (has_xclip_) {
    cmd = "xclip -selection clipboard -t image/png 2>/dev/null";
  } else {
    return Error(ErrorCode::ClipboardToolMissing,
                 "xsel cannot write images. Install xclip.");
  }

  return execute_command_with_input(cmd, image.data.data(), image.data.size());
}

} // namespace platform
} // namespace clipsync
