#include <iostream>
#include <string>

#include "argspec/argspec.hpp"

int main(int argc, char** argv) {
    argspec::Config config;
    config.usage = "server [<options>] <paths>...";

    const auto result = argspec::parse(argc,
                                       argv,
                                       {
                                           {"port", "-p,--port:number=3000;         Port to use"},
                                           {"address", "-a,--address:string=\"0.0.0.0\"; Address to use"},
                                           {"cors", "--cors:boolean;                Enable CORS"},
                                           {"help", "--help:boolean;                Show this help"},
                                       },
                                       config);

    const auto port = result.options.get<double>("port");
    const auto& address = result.options.get<std::string>("address");
    const auto cors = result.options.get<bool>("cors");
    std::cout << "listening on " << address << ":" << port << (cors ? " (cors)" : "") << "\n";
    for (const auto& path : result.targets) std::cout << "serving " << path << "\n";
    return 0;
}
