#ifndef TUSCAN_CLI_SUBCOMMAND_HPP
#define TUSCAN_CLI_SUBCOMMAND_HPP

#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace tuscan {
namespace cli {

// Entry point; argv[0] is the subcommand name
using SubcommandFn = int (*)(int argc, char* argv[]);

struct Subcommand {
    std::string name;
    std::string summary;
    SubcommandFn run;
    int order;      // Position in the help listing
};

// Name -> handler table, filled by static SubcommandRegistrar objects
class SubcommandRegistry {
public:
    static SubcommandRegistry& instance();

    void add(Subcommand cmd);

    // nullptr when no such command
    const Subcommand* find(const std::string& name) const;

    // Commands in help-listing order
    std::vector<const Subcommand*> listing() const;

    void print_help(std::ostream& out, const char* program_name) const;

private:
    SubcommandRegistry() = default;
    std::map<std::string, Subcommand> commands_;
};

struct SubcommandRegistrar {
    SubcommandRegistrar(const char* name, const char* summary, SubcommandFn run, int order) {
        SubcommandRegistry::instance().add(Subcommand{name, summary, run, order});
    }
};

int cmd_scan(int argc, char* argv[]);
int cmd_score(int argc, char* argv[]);
int cmd_features(int argc, char* argv[]);

}  // namespace cli
}  // namespace tuscan

#endif  // TUSCAN_CLI_SUBCOMMAND_HPP
