#include "Builtins.hpp"

#include "../shell/CommandRegistry.hpp"

namespace Builtins {
    void register_all(CommandRegistry& reg) {
        reg.add(make_pwd());
        reg.add(make_cd());
        reg.add(make_ls());
        reg.add(make_mkdir());
        reg.add(make_rmdir());
        reg.add(make_rm());
        reg.add(make_touch());
        reg.add(make_mv());
        reg.add(make_cp());
        reg.add(make_echo());
        reg.add(make_cat());
        reg.add(make_head());
        reg.add(make_tail());
        reg.add(make_wc());
        reg.add(make_grep());
        reg.add(make_find());
        reg.add(make_tree());
        reg.add(make_du());
        reg.add(make_df());
        reg.add(make_stat());
        reg.add(make_chmod());
        reg.add(make_date());
        reg.add(make_uptime());
        reg.add(make_whoami());
        reg.add(make_hostname());
        reg.add(make_cpu());
        reg.add(make_mem());
        reg.add(make_ps());
        reg.add(make_md5sum());
        reg.add(make_sha256sum());
        reg.add(make_clear());
        reg.add(make_which());
        reg.add(make_help());
        reg.alias("--help", "help");
        reg.alias("-h", "help");
    }
}
