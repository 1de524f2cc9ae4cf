#pragma once
#include <memory>

#include "../shell/ICommand.hpp"

class CommandRegistry;

namespace Builtins {
    std::unique_ptr<ICommand> make_pwd();
    std::unique_ptr<ICommand> make_cd();
    std::unique_ptr<ICommand> make_ls();
    std::unique_ptr<ICommand> make_mkdir();
    std::unique_ptr<ICommand> make_rmdir();
    std::unique_ptr<ICommand> make_rm();
    std::unique_ptr<ICommand> make_touch();
    std::unique_ptr<ICommand> make_mv();
    std::unique_ptr<ICommand> make_cp();
    std::unique_ptr<ICommand> make_echo();
    std::unique_ptr<ICommand> make_cat();
    std::unique_ptr<ICommand> make_head();
    std::unique_ptr<ICommand> make_tail();
    std::unique_ptr<ICommand> make_wc();
    std::unique_ptr<ICommand> make_grep();
    std::unique_ptr<ICommand> make_find();
    std::unique_ptr<ICommand> make_tree();
    std::unique_ptr<ICommand> make_du();
    std::unique_ptr<ICommand> make_df();
    std::unique_ptr<ICommand> make_stat();
    std::unique_ptr<ICommand> make_chmod();
    std::unique_ptr<ICommand> make_date();
    std::unique_ptr<ICommand> make_uptime();
    std::unique_ptr<ICommand> make_whoami();
    std::unique_ptr<ICommand> make_hostname();
    std::unique_ptr<ICommand> make_cpu();
    std::unique_ptr<ICommand> make_mem();
    std::unique_ptr<ICommand> make_ps();
    std::unique_ptr<ICommand> make_md5sum();
    std::unique_ptr<ICommand> make_sha256sum();
    std::unique_ptr<ICommand> make_clear();
    std::unique_ptr<ICommand> make_which();
    std::unique_ptr<ICommand> make_help();

    // Register every builtin verb (and the --help / -h aliases).
    void register_all(CommandRegistry& reg);
}
