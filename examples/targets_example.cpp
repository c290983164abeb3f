#include <iostream>
#include <string>
#include <vector>

#include "argspec/argspec.hpp"

// Prints targets and everything after `--`. Exits with an error when no file is given.
int main(int argc, char** argv) {
    argspec::Config config;
    config.usage = "targets [--verbose] <files>... [-- <passthrough>...]";
    config.requireTarget = argspec::RequireTarget::on("at least one file is required");

    const auto result = argspec::parse(argc,
                                       argv,
                                       {
                                           {"verbose", "-v,--verbose:boolean; Print the help text too"},
                                           {"name", "--name:string!;       Name of the run"},
                                       },
                                       config);

    std::cout << "run " << result.options.get<std::string>("name") << "\n";
    for (const auto& t : result.targets) std::cout << "file " << t << "\n";
    for (const auto& r : result.rest) std::cout << "pass " << r << "\n";
    if (result.options.get<bool>("verbose")) std::cout << result.help();
    return 0;
}
