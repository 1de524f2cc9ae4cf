#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../core/Errors.hpp"

#include <cerrno>
#include <system_error>
#include <unistd.h>

class Hostname : public ICommand {
public:
    std::string name() const override { return "hostname"; }
    std::string help() const override {
        return R"(hostname: print the system host name
Synopsis:
  hostname
)";
    }
    Outcome execute(CommandContext& ctx) override {
        char buf[256] = {};
        if (gethostname(buf, sizeof(buf) - 1) != 0) {
            throw IOFailure("hostname: " + std::error_code(errno, std::generic_category()).message());
        }
        ctx.out << buf << '\n';
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_hostname(){ return std::make_unique<Hostname>(); } }
