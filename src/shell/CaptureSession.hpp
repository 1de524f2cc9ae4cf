#pragma once
#include <string>
#include <vector>

class IFileSystem;

enum class CaptureKind { Heredoc, RawInput };
enum class WriteMode { Overwrite, Append };

// An open multi-line capture started by `cat > file`, `cat >> file` or
// `cat > file << WORD`. Lines accumulate until the terminator (heredoc) or
// a blank line (raw input), then the buffer is flushed to the target.
class CaptureSession {
public:
    // owner is the verb that opened the session; it prefixes flush errors.
    static CaptureSession heredoc(std::string owner, std::string target, WriteMode mode, std::string terminator);
    static CaptureSession raw_input(std::string owner, std::string target, WriteMode mode);

    // Returns true when `line` closes the session; otherwise it is buffered.
    bool feed(const std::string& line);

    // Buffered lines joined by '\n' with a trailing newline.
    std::string content() const;
    void flush(IFileSystem& fs) const;

    const std::string& owner() const { return owner_; }
    CaptureKind kind() const { return kind_; }
    WriteMode mode() const { return mode_; }
    const std::string& target() const { return target_; }
    const std::string& terminator() const { return terminator_; }
    const std::vector<std::string>& lines() const { return lines_; }

private:
    CaptureSession(std::string owner, CaptureKind kind, std::string target, WriteMode mode, std::string terminator);

    std::string owner_;
    CaptureKind kind_;
    std::string target_;
    WriteMode mode_;
    std::string terminator_;
    std::vector<std::string> lines_;
};
