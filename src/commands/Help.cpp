#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../shell/CommandRegistry.hpp"
#include "../core/Errors.hpp"

static const char* kOverview =
    "Supported commands:\n"
    "File Operations:\n"
    "  pwd                          - Print working directory\n"
    "  ls [-l] [-a] [path]          - List directory contents\n"
    "  cd <path>                    - Change directory\n"
    "  mkdir <name>                 - Create directory\n"
    "  rmdir <name>                 - Remove empty directory\n"
    "  rm [-r] <path>               - Remove file or directory\n"
    "  cat <file>                   - Display file contents\n"
    "  touch <file>                 - Create empty file or update timestamp\n"
    "  mv <src> <dest>              - Move/rename files\n"
    "  cp [-r] <src> <dest>         - Copy files or directories\n"
    "  head [-n num] <file>         - Display first lines of file (default 10)\n"
    "  tail [-n num] <file>         - Display last lines of file (default 10)\n"
    "  wc <file>                    - Count lines, words, characters\n"
    "  grep <pattern> <file>        - Search for pattern in file\n"
    "  find [path] [-name pattern]  - Find files matching pattern\n"
    "\n"
    "File Information:\n"
    "  stat <file>                  - Display file status and metadata\n"
    "  chmod <mode> <file>          - Change file permissions (octal)\n"
    "  du [path]                    - Display disk usage\n"
    "  df                           - Display filesystem disk space\n"
    "  tree [path]                  - Display directory tree structure\n"
    "  md5sum <file>                - Calculate MD5 checksum\n"
    "  sha256sum <file>             - Calculate SHA256 checksum\n"
    "\n"
    "Text Output:\n"
    "  echo [text]                  - Print text to stdout\n"
    "  echo [text] > file           - Write text to file (overwrite)\n"
    "  echo [text] >> file          - Append text to file\n"
    "  cat > file                   - Write input to file (empty line to end)\n"
    "  cat >> file                  - Append input to file (empty line to end)\n"
    "  cat >> file << EOF           - Heredoc: write until EOF is entered\n"
    "\n"
    "System Information:\n"
    "  cpu                          - Display CPU usage\n"
    "  mem                          - Display memory usage\n"
    "  ps                           - List running processes\n"
    "  date                         - Display current date and time\n"
    "  uptime                       - Display system uptime\n"
    "  whoami                       - Display current user\n"
    "  hostname                     - Display system hostname\n"
    "\n"
    "Utilities:\n"
    "  clear                        - Clear screen\n"
    "  which <cmd>                  - Show command location\n"
    "  help [cmd]                   - Display this help, or details for one command\n";

class Help : public ICommand {
public:
    std::string name() const override { return "help"; }
    std::string help() const override {
        return R"(help: show help for commands
Synopsis:
  help [command]
Notes:
  With no arguments, prints the command overview. With a command name,
  shows that command's usage, options, and examples. Also available as
  --help and -h.
Examples:
  help
  help ls
)";
    }
    Outcome execute(CommandContext& ctx) override {
        if (ctx.args.size() == 1) {
            ctx.out << kOverview;
            return 0;
        }
        auto* cmd = ctx.registry.find(ctx.args[1]);
        if (!cmd) throw NotFoundError("help: unknown command: " + ctx.args[1]);
        ctx.out << cmd->help();
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_help(){ return std::make_unique<Help>(); } }
