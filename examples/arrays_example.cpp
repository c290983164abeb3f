#include <iostream>
#include <string>
#include <vector>

#include "argspec/argspec.hpp"

// app -n 1 --num=2 -t a -t b
int main(int argc, char** argv) {
    argspec::Config config;
    config.usage = "arrays [-n <number>]... [-t <tag>]...";

    const auto result = argspec::parse(argc,
                                       argv,
                                       {
                                           {"nums", "-n,--num:number[]=[1,2]; Numbers to sum"},
                                           {"tags", "-t,--tag:string[];        Tags to print"},
                                           {"help", "-h,--help:boolean;        Show this help"},
                                       },
                                       config);

    double sum = 0;
    for (const auto n : result.options.get<std::vector<double>>("nums")) sum += n;
    std::cout << "sum=" << sum << "\n";
    for (const auto& tag : result.options.get<std::vector<std::string>>("tags")) std::cout << "tag=" << tag << "\n";
    return 0;
}
