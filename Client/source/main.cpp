#include <chrono>
#include <stdexcept>
#include <variant>
#include <string>

#include <getopt.h>

#include <fmt/ranges.h>
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "GrpcStorageClient.hpp"
#include "ObjectMetaData.hpp"
#include "SizeParser.hpp"
#include "UploadConfig.hpp"
#include "UploadJob.hpp"

namespace {
        enum LongOnlyOption {
                kMinPartSize = 1000,
                kReducedRedundancy,
                kInsecure
        };

        struct Arguments {
                UploadConfig config;
                std::string endpoint = "localhost:50051";
                std::string src;
                std::string dest;
        };

        std::string Usage(const char* program)
        {
                const UploadConfig defaults;

                return fmt::format(
                        "usage: {} [options] <src> <dest>\n"
                        "Upload large files to S3 using parallel chunked transfers\n"
                        "  -n, --num-processes N     Number of parallel transfers (default: {})\n"
                        "  -f, --force               Overwrite any pre-existing S3 object with the same name\n"
                        "  -s, --split SIZE          Split size to use (default: {}). Accepts suffixes: {}\n"
                        "  -T, --threshold SIZE      Files of at least this size use multipart upload (default: {})\n"
                        "  -t, --max-tries N         Maximum upload attempts, before failure (default: {})\n"
                        "  -r, --retry-sleep SEC     Seconds to wait before the first retry, doubled after each failure (default: {})\n"
                        "  -e, --endpoint HOST:PORT  Object store endpoint (default: localhost:50051)\n"
                        "      --min-part-size SIZE  Smallest part accepted by the store (default: 5 MiB)\n"
                        "      --rrs, --reduced-redundancy  Unused parameter, here for compatibility purposes\n"
                        "      --insecure            Unused parameter, here for compatibility purposes\n"
                        "  -v, --verbose             Print more output\n"
                        "  -q, --quiet               Print less output",
                        program, defaults.parallelism, defaults.part_size,
                        fmt::join(SizeParser::UnitNames(), ", "),
                        defaults.multipart_threshold, defaults.max_attempts,
                        std::chrono::duration_cast<std::chrono::seconds>(defaults.retry_delay).count());
        }

        unsigned int ParseCount(const char* value, const char* name)
        {
                size_t used = 0;
                const unsigned long parsed = std::stoul(value, &used);
                if (used != std::string(value).size() || parsed > 0xFFFFFFFFUL)
                        throw std::invalid_argument(fmt::format("{} must be a whole number: {}", name, value));

                return static_cast<unsigned int>(parsed);
        }
}

std::pair<bool, std::variant<Arguments, std::string>> ParseArgument(int argc, char* argv[])
{
        Arguments args;

        const struct option options[] = {
                { "num-processes", required_argument, nullptr, 'n' },
                { "force", no_argument, nullptr, 'f' },
                { "split", required_argument, nullptr, 's' },
                { "threshold", required_argument, nullptr, 'T' },
                { "max-tries", required_argument, nullptr, 't' },
                { "retry-sleep", required_argument, nullptr, 'r' },
                { "endpoint", required_argument, nullptr, 'e' },
                { "min-part-size", required_argument, nullptr, kMinPartSize },
                { "rrs", no_argument, nullptr, kReducedRedundancy },
                { "reduced-redundancy", no_argument, nullptr, kReducedRedundancy },
                { "insecure", no_argument, nullptr, kInsecure },
                { "verbose", no_argument, nullptr, 'v' },
                { "quiet", no_argument, nullptr, 'q' },
                { "help", no_argument, nullptr, 'h' },
                { nullptr, 0, nullptr, 0 }
        };

        try {
                int optidx;
                for (int opt; (opt = getopt_long(argc, argv, ":n:fs:T:t:r:e:vqh", options, &optidx)) != -1; ) {
                        switch (opt) {
                        case 'n':
                                args.config.parallelism = ParseCount(optarg, "--num-processes");
                                break;
                        case 'f':
                                args.config.force = true;
                                break;
                        case 's':
                                args.config.part_size = optarg;
                                break;
                        case 'T':
                                args.config.multipart_threshold = optarg;
                                break;
                        case 't':
                                args.config.max_attempts = ParseCount(optarg, "--max-tries");
                                break;
                        case 'r':
                                args.config.retry_delay = std::chrono::seconds(ParseCount(optarg, "--retry-sleep"));
                                break;
                        case 'e':
                                args.endpoint = optarg;
                                break;
                        case kMinPartSize: {
                                const auto [ok, bytes, err] = SizeParser::Parse(optarg, "byte", "byte");
                                if (!ok)
                                        return { false, err.message };
                                args.config.min_part_size = bytes;
                                break;
                        }
                        case kReducedRedundancy:
                                args.config.reduced_redundancy = true;
                                break;
                        case kInsecure:
                                args.config.insecure = true;
                                break;
                        case 'v':
                                args.config.verbose = true;
                                break;
                        case 'q':
                                args.config.quiet = true;
                                break;
                        case 'h':
                                return { false, Usage(*argv) };
                        case ':':
                                return { false, fmt::format("missing argument: {}", argv[optind - 1]) };
                        case '?':
                                return { false, fmt::format("invalid argument: {}", argv[optind - 1]) };
                        }
                }
        }
        catch (std::exception& e) {
                return { false, fmt::format("invalid argument: {}", e.what()) };
        }

        if (argc - optind != 2)
                return { false, Usage(*argv) };

        args.src = argv[optind];
        args.dest = argv[optind + 1];

        return { true, args };
}

int main(int argc, char* argv[])
{
        auto logger = spdlog::stderr_color_mt("mpupload");
        logger->set_pattern("%Y-%m-%d %H:%M:%S %l: %v");
        logger->set_level(spdlog::level::info);

        const auto &[success, result] = ParseArgument(argc, argv);
        if (!success) {
                logger->error("failed to ParseArgument(): {}", std::get<std::string>(result));
                return 1;
        }

        const Arguments& args = std::get<Arguments>(result);

        if (args.config.quiet)
                logger->set_level(spdlog::level::warn);
        if (args.config.verbose)
                logger->set_level(spdlog::level::debug);

        logger->debug("src: {}, dest: {}, endpoint: {}, parallel: {}, split: {}, threshold: {}, max tries: {}, force: {}",
                      args.src, args.dest, args.endpoint, args.config.parallelism, args.config.part_size,
                      args.config.multipart_threshold, args.config.max_attempts, args.config.force);

        std::shared_ptr<grpc::Channel> channel = grpc::CreateChannel(args.endpoint, grpc::InsecureChannelCredentials());
        logger->debug("channel opened at: {}", args.endpoint);

        GrpcStorageClient client(channel);
        UploadJob job(client, args.config, logger);

        if (const auto err = job.Run(args.src, args.dest)) {
                logger->error("upload failed ({} error): {}", UploadErrorKindName(err->kind), err->message);
                return 1;
        }

        if (logger->should_log(spdlog::level::debug)) {
                const DestinationTarget& target = job.GetTarget();
                const auto [found, metadata, err] = client.HeadObject(target.container, target.key);
                if (found)
                        logger->debug("object uploaded successfully: \n{}", ObjectMetaDataToString(metadata));
                else
                        logger->debug("uploaded object could not be inspected: {}", err.message);
        }

        return 0;
}
