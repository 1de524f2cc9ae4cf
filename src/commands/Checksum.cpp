#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../util/Digest.hpp"
#include "Helpers.hpp"

#include <utility>

static const size_t kChunkSize = 4096;

// md5sum and sha256sum differ only in name and algorithm.
class Checksum : public ICommand {
public:
    Checksum(std::string name, DigestAlgorithm algorithm, std::string label)
        : name_(std::move(name)), algorithm_(algorithm), label_(std::move(label)) {}

    std::string name() const override { return name_; }
    std::string help() const override {
        return name_ + ": print " + label_ + R"( checksums
Synopsis:
  )" + name_ + R"( <file>...
Output:
  HEXDIGEST  FILE, one line per file
Examples:
  )" + name_ + " archive.tar\n";
    }
    Outcome execute(CommandContext& ctx) override {
        if (ctx.args.size() < 2) throw OperandError(name_ + ": missing file operand");
        std::string report;
        for (size_t i = 1; i < ctx.args.size(); ++i) {
            const auto& file = ctx.args[i];
            auto p = require_file(ctx, name_, file);
            Digest digest(algorithm_);
            ctx.fs.readChunks(p, kChunkSize, [&](const char* data, size_t len){ digest.update(data, len); });
            report += digest.hexdigest() + "  " + file + "\n";
        }
        ctx.out << report;
        return 0;
    }

private:
    std::string name_;
    DigestAlgorithm algorithm_;
    std::string label_;
};

namespace Builtins {
    std::unique_ptr<ICommand> make_md5sum(){ return std::make_unique<Checksum>("md5sum", DigestAlgorithm::Md5, "MD5"); }
    std::unique_ptr<ICommand> make_sha256sum(){ return std::make_unique<Checksum>("sha256sum", DigestAlgorithm::Sha256, "SHA-256"); }
}
