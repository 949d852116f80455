#include "ff/find/find_app.hpp"
#include "ff/find/find_options.hpp"
#include "ff/logging.hpp"
#include "ff/options.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char **argv)
{
    ff::logging::initialize();

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);

    ff::config::OptionRegistry options(ff::find::kAppId);
    ff::find::registerFindOptions(options);
    if (!options.loadDefaults())
        spdlog::debug("No options loaded from {}", options.defaultOptionsPath().string());

    const ff::find::SearchEnvironment environment = ff::find::detectSearchEnvironment(options);
    return ff::find::runSearch(args, environment, options, std::cout, std::cerr);
}
