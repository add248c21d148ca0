
#include <memory>
#include <variant>
#include <string>
#include <vector>
#include <map>

#include <getopt.h>

#include <grpcpp/support/server_interceptor.h>
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "ObjectStoreServiceImpl.hpp"
#include "ServerInterceptor.hpp"
#include "SizeParser.hpp"

using ArgList = std::map<std::string, std::string>;

std::pair<bool, std::variant<ArgList, std::string>> ParseArgument(int argc, char* argv[])
{
    ArgList arglist;

    const struct option options[] = {
            { "loglevel", required_argument, nullptr, 'l' },
            { "root-dir", required_argument, nullptr, 'r' },
            { "min-part-size", required_argument, nullptr, 'm' },
            { nullptr, 0, nullptr, 0 }
    };

    try {
        int optidx;
        for (int opt; (opt = getopt_long(argc, argv, "l:r:m:", options, &optidx)) != -1; ) {
            switch (opt) {
            case 'l':
                arglist["loglevel"] = optarg;
                break;
            case 'r':
                arglist["root-dir"] = optarg;
                break;
            case 'm':
                arglist["min-part-size"] = optarg;
                break;
            case ':':
                return { false, fmt::format("missing argument: {}", static_cast<char>(optopt)) };
            case '?':
                return { false, fmt::format("invalid argument: {}", static_cast<char>(optopt)) };
            }
        }
    }
    catch (std::exception& e) {
        return { false, fmt::format("invalid argument: {}", e.what()) };
    }

    const char* program = *argv;

    argc -= optind;
    if (argc < 2)
        return { false, fmt::format("usage: {} [--loglevel <level>] [--root-dir <directory>] [--min-part-size <size>] <host> <service>", program) };

    argv += optind;

    arglist["host"] = *argv++;
    arglist["service"] = *argv++;

    if (arglist.find("root-dir") == arglist.end())
        arglist["root-dir"] = ".";

    if (arglist.find("loglevel") == arglist.end())
        arglist["loglevel"] = "info";

    if (arglist.find("min-part-size") == arglist.end())
        arglist["min-part-size"] = "5 MiB";

    return { true, arglist };
}

void ShowArgument(const std::shared_ptr<spdlog::logger>& logger, const ArgList& arglist)
{
    for (const auto &[name, value]: arglist)
        logger->info("{}: {}", name, value);
}

int main(int argc, char* argv[])
{
    auto logger = spdlog::stdout_color_mt("mpstore");

    const auto &[success, result] = ParseArgument(argc, argv);
    if (!success) {
        logger->error("failed to ParseArgument(): {}", std::get<std::string>(result));
        return 1;
    }

    const ArgList& arglist = std::get<ArgList>(result);

    const auto level = spdlog::level::from_str(arglist.at("loglevel"));
    if (level == spdlog::level::off && arglist.at("loglevel") != "off") {
        logger->error("invalid log level: {}", arglist.at("loglevel"));
        return 1;
    }
    logger->set_level(level);

    ShowArgument(logger, arglist);

    const auto [size_ok, min_part_size, size_err] = SizeParser::Parse(arglist.at("min-part-size"), "byte", "byte");
    if (!size_ok) {
        logger->error("invalid --min-part-size: {}", size_err.message);
        return 1;
    }

    ObjectStoreServiceImpl service(arglist.at("root-dir"), min_part_size, logger);
    if (!service.IsValid()) {
        logger->error("failed to create object store: invalid root directory {}", arglist.at("root-dir"));
        return 1;
    }

    if (const auto err = service.ResetStaging()) {
        logger->error("failed to prepare object store: {}", *err);
        return 1;
    }
    logger->info("registered service(s): ObjectStore");

    std::vector<std::unique_ptr<grpc::experimental::ServerInterceptorFactoryInterface>> interceptors;
    interceptors.push_back(std::make_unique<ServerInterceptorFactory>(logger));

    const std::string address = fmt::format("{}:{}", arglist.at("host"), arglist.at("service"));

    grpc::ServerBuilder builder;
    builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);
    builder.experimental().SetInterceptorCreators(std::move(interceptors));

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        logger->error("failed to start server on {}", address);
        return 1;
    }
    logger->info("server started: listening on {}", address);

    server->Wait();

    logger->info("server stopped");

    return 0;
}
