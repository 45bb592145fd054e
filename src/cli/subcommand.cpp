#include "subcommand.hpp"
#include "tuscan/version.h"
#include <algorithm>

namespace tuscan {
namespace cli {

SubcommandRegistry& SubcommandRegistry::instance() {
    static SubcommandRegistry registry;
    return registry;
}

void SubcommandRegistry::add(Subcommand cmd) {
    // Later registration under the same name wins
    const std::string key = cmd.name;
    commands_[key] = std::move(cmd);
}

const Subcommand* SubcommandRegistry::find(const std::string& name) const {
    auto it = commands_.find(name);
    return it == commands_.end() ? nullptr : &it->second;
}

std::vector<const Subcommand*> SubcommandRegistry::listing() const {
    std::vector<const Subcommand*> out;
    out.reserve(commands_.size());
    for (const auto& [name, cmd] : commands_) {
        out.push_back(&cmd);
    }
    std::stable_sort(out.begin(), out.end(), [](const Subcommand* a, const Subcommand* b) {
        return a->order < b->order;
    });
    return out;
}

void SubcommandRegistry::print_help(std::ostream& out, const char* program_name) const {
    out << "TUSCAN v" << TUSCAN_VERSION << " - Cas9 site discovery and efficiency scoring\n\n";
    out << "Usage: " << program_name << " <command> [options]\n\n";

    const auto cmds = listing();
    size_t width = 0;
    for (const Subcommand* c : cmds) width = std::max(width, c->name.size());

    out << "Commands:\n";
    for (const Subcommand* c : cmds) {
        out << "  " << c->name << std::string(width - c->name.size() + 3, ' ') << c->summary << "\n";
    }

    out << "\nGlobal options:\n";
    out << "  -h, --help       Show this message\n";
    out << "  -V, --version    Show version\n";
    out << "\nEnvironment:\n";
    out << "  TUSCAN_MODEL_DIR   Directory holding rf_regression.forest / rf_classification.forest\n";
    out << "  TUSCAN_THREADS     Default thread count when -t is not given\n";
    out << "\nRun '" << program_name << " help <command>' for command options.\n";
}

}  // namespace cli
}  // namespace tuscan
