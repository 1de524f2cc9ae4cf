#include "CaptureSession.hpp"

#include <cctype>

#include "../fs/IFileSystem.hpp"

static std::string trim(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    size_t j = s.size();
    while (j > i && std::isspace(static_cast<unsigned char>(s[j-1]))) --j;
    return s.substr(i, j - i);
}

CaptureSession::CaptureSession(std::string owner, CaptureKind kind, std::string target, WriteMode mode, std::string terminator)
    : owner_(std::move(owner)), kind_(kind), target_(std::move(target)), mode_(mode), terminator_(std::move(terminator)) {}

CaptureSession CaptureSession::heredoc(std::string owner, std::string target, WriteMode mode, std::string terminator) {
    return CaptureSession(std::move(owner), CaptureKind::Heredoc, std::move(target), mode, std::move(terminator));
}

CaptureSession CaptureSession::raw_input(std::string owner, std::string target, WriteMode mode) {
    return CaptureSession(std::move(owner), CaptureKind::RawInput, std::move(target), mode, std::string());
}

bool CaptureSession::feed(const std::string& line) {
    auto t = trim(line);
    if (kind_ == CaptureKind::Heredoc ? t == terminator_ : t.empty()) return true;
    std::string kept = line;
    // line terminators from the transport are not content
    while (!kept.empty() && (kept.back() == '\n' || kept.back() == '\r')) kept.pop_back();
    lines_.push_back(std::move(kept));
    return false;
}

std::string CaptureSession::content() const {
    std::string data;
    for (size_t i = 0; i < lines_.size(); ++i) {
        if (i > 0) data += '\n';
        data += lines_[i];
    }
    data += '\n';
    return data;
}

void CaptureSession::flush(IFileSystem& fs) const {
    fs.writeFile(target_, content(), mode_ == WriteMode::Append);
}
