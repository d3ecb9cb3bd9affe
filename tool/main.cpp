#include <fcntl.h>
#include <getopt.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "columnar_emitter.h"
#include "heapgraph.h"
#include "logger.h"
#include "record_counter.h"
#include "table_writer.h"
#include "text_dumper.h"

using namespace heapgraph;

static constexpr int kExitOk = 0;
static constexpr int kExitDecodeError = 1;
static constexpr int kExitUsage = 2;

static const char *level_tag(int prio) {
    switch (prio) {
        case log::kLevelVerbose:
            return "V";
        case log::kLevelDebug:
            return "D";
        case log::kLevelInfo:
            return "I";
        case log::kLevelWarn:
            return "W";
        case log::kLevelError:
            return "E";
        default:
            return "F";
    }
}

static int stderr_log(int prio, const char *msg) {
    return fprintf(stderr, "heapgraph %s: %s\n", level_tag(prio), msg);
}

static bool parse_log_level(const char *value, log::log_level_t *level) {
    static const struct {
        const char *name;
        log::log_level_t level;
    } levels[] = {
            {"verbose", log::kLevelVerbose},
            {"debug",   log::kLevelDebug},
            {"info",    log::kLevelInfo},
            {"warn",    log::kLevelWarn},
            {"error",   log::kLevelError},
            {"none",    log::kLevelNone},
    };
    for (const auto &entry: levels) {
        if (strcmp(value, entry.name) == 0) {
            *level = entry.level;
            return true;
        }
    }
    return false;
}

static void usage(const char *program) {
    fprintf(stderr,
            "usage: %s -f FILE [-v LEVEL] [-o DIR] [--isolate-groups] COMMAND\n"
            "\n"
            "commands:\n"
            "  dump-objects              print classes, instances and arrays to stdout\n"
            "  count-records             print the number of each top-level record type\n"
            "  dump-objects-to-parquet   write one parquet table per class under DIR (default parquet/)\n"
            "\n"
            "options:\n"
            "  -f, --file FILE           heap dump to read\n"
            "  -v, --verbosity LEVEL     verbose, debug, info, warn (default), error or none\n"
            "  -o, --output DIR          output directory of dump-objects-to-parquet\n"
            "      --isolate-groups      decode each heap dump segment group on its own\n",
            program);
}

static void print_summary(const DecodeSummary &summary) {
    fprintf(stderr, "%zu records, %zu classes, %zu objects in %zu segment groups\n", summary.record_count,
            summary.class_count, summary.object_count, summary.group_count);
    if (summary.GetErrorCount() == 0) return;
    fprintf(stderr, "%zu recoverable errors, output is partial:\n", summary.GetErrorCount());
    for (const auto &[kind, count]: summary.error_counts) {
        fprintf(stderr, "  %s: %zu\n", error_kind_name(kind), count);
    }
}

int main(int argc, char *argv[]) {
    const char *file = nullptr;
    std::string output_directory = "parquet";
    bool isolate_groups = false;
    log::log_level_t log_level = log::kLevelWarn;

    enum {
        kOptionIsolateGroups = 0x100,
    };
    struct option opts[] = {{
            .name = "file",
            .has_arg = 1,
            .flag = nullptr,
            .val = 'f'
    }, {
            .name = "verbosity",
            .has_arg = 1,
            .flag = nullptr,
            .val = 'v'
    }, {
            .name = "output",
            .has_arg = 1,
            .flag = nullptr,
            .val = 'o'
    }, {
            .name = "isolate-groups",
            .has_arg = 0,
            .flag = nullptr,
            .val = kOptionIsolateGroups
    }, {
            .name = "help",
            .has_arg = 0,
            .flag = nullptr,
            .val = 'h'
    }, {nullptr, 0, nullptr, 0}};
    bool processing = true;
    do {
        switch (getopt_long(argc, argv, "f:v:o:h", opts, nullptr)) {
            case -1:
                processing = false;
                break;
            case 'f':
                file = optarg;
                break;
            case 'v':
                if (!parse_log_level(optarg, &log_level)) {
                    fprintf(stderr, "Unknown verbosity level %s\n", optarg);
                    return kExitUsage;
                }
                break;
            case 'o':
                output_directory = optarg;
                break;
            case kOptionIsolateGroups:
                isolate_groups = true;
                break;
            case 'h':
                usage(argv[0]);
                return kExitOk;
            default:
                usage(argv[0]);
                return kExitUsage;
        }
    } while (processing);

    if (file == nullptr || optind + 1 != argc) {
        usage(argv[0]);
        return kExitUsage;
    }
    const std::string command = argv[optind];
    if (command != "dump-objects" && command != "count-records" && command != "dump-objects-to-parquet") {
        fprintf(stderr, "Unknown command %s\n", command.c_str());
        usage(argv[0]);
        return kExitUsage;
    }

    log::SetLogFunc(stderr_log);
    log::SetLogLevel(log_level);

    const int fd = open(file, O_RDONLY);
    if (fd < 0) {
        fprintf(stderr, "Could not open file at path %s: %s\n", file, strerror(errno));
        return kExitDecodeError;
    }
    HprofDecoder decoder(fd);
    close(fd);
    decoder.SetGroupIsolation(isolate_groups);

    std::optional<DecodeSummary> summary;
    if (command == "count-records") {
        sink::RecordCounter counter;
        decoder.SetObjectDecoding(false);
        summary = decoder.Decode([&counter](const event_t &event) { counter.Handle(event); });
        if (summary.has_value()) counter.Print(std::cout);
    } else if (command == "dump-objects") {
        sink::TextDumper dumper(std::cout);
        summary = decoder.Decode([&dumper](const event_t &event) { dumper.Handle(event); });
    } else {
        std::error_code error;
        std::filesystem::create_directories(output_directory, error);
        if (error) {
            fprintf(stderr, "Could not create directory %s: %s\n", output_directory.c_str(),
                    error.message().c_str());
            return kExitDecodeError;
        }
        sink::ParquetTableWriter writer(output_directory);
        sink::ColumnarEmitter emitter(writer);
        try {
            summary = decoder.Decode([&emitter](const event_t &event) { emitter.Handle(event); });
            emitter.Flush();
            writer.Close();
        } catch (const std::exception &e) {
            fprintf(stderr, "Could not write tables under %s: %s\n", output_directory.c_str(), e.what());
            return kExitDecodeError;
        }
    }
    std::cout.flush();

    if (!summary.has_value()) {
        fprintf(stderr, "Failed to decode %s: %s\n", file, HprofDecoder::CheckError());
        return kExitDecodeError;
    }
    print_summary(summary.value());
    return kExitOk;
}
