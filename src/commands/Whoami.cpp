#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../core/Environment.hpp"
#include "../core/Errors.hpp"

#include <pwd.h>
#include <unistd.h>

class Whoami : public ICommand {
public:
    std::string name() const override { return "whoami"; }
    std::string help() const override {
        return R"(whoami: print the current user name
Synopsis:
  whoami
Notes:
  Taken from LOGNAME, USER, LNAME or USERNAME, else the password database.
)";
    }
    Outcome execute(CommandContext& ctx) override {
        for (const char* key : {"LOGNAME", "USER", "LNAME", "USERNAME"}) {
            auto v = ctx.env.get(key);
            if (!v.empty()) { ctx.out << v << '\n'; return 0; }
        }
        auto* pw = getpwuid(getuid());
        if (!pw) throw IOFailure("whoami: cannot find name for user ID " + std::to_string(getuid()));
        ctx.out << pw->pw_name << '\n';
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_whoami(){ return std::make_unique<Whoami>(); } }
