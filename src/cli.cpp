/**
 * @file cli.cpp
 * @brief saudi-id command implementations
 */

#include "saudi_id/cli.h"
#include "saudi_id/exceptions.h"
#include "saudi_id/generator.h"
#include "saudi_id/logging/logger.h"
#include "saudi_id/national_id.h"
#include "saudi_id/random_source.h"
#include <json/json.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>

namespace saudi_id::cli {

namespace {

struct Options {
    std::string command;
    std::vector<std::string> operands;
    std::optional<Category> type;
    std::optional<std::string> count;
    std::optional<uint64_t> seed;
    bool help = false;
};

/// Thrown while reading arguments; turned into EXIT_USAGE
class UsageError : public SaudiIdException {
public:
    explicit UsageError(const std::string& message) : SaudiIdException(message) {}
};

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }
    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }
    return str.substr(start, end - start);
}

bool isAsciiDigits(const std::string& str) {
    for (char c : str) {
        if (c < '0' || c > '9') return false;
    }
    return !str.empty();
}

const std::string& requireValue(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) {
        throw UsageError("option " + args[i] + " requires a value");
    }
    return args[++i];
}

Options parseArguments(const std::vector<std::string>& args, config::ToolConfig& config) {
    Options opts;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--json") {
            config.outputFormat = "json";
        } else if (arg == "--log-level") {
            config.logLevel = requireValue(args, i);
        } else if (arg == "--type") {
            const std::string& value = requireValue(args, i);
            opts.type = categoryFromString(value);
            if (!opts.type) {
                throw UsageError("unknown type '" + value + "' (expected citizen or resident)");
            }
        } else if (arg == "--count") {
            opts.count = requireValue(args, i);
        } else if (arg == "--seed") {
            const std::string& value = requireValue(args, i);
            if (!isAsciiDigits(value) || value.length() > 19) {
                throw UsageError("seed must be a non-negative integer, got '" + value + "'");
            }
            opts.seed = std::stoull(value);
        } else if (arg.size() > 1 && arg[0] == '-' && arg != "-") {
            throw UsageError("unknown option " + arg);
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.operands.push_back(arg);
        }
    }

    return opts;
}

void writeJson(std::ostream& out, const Json::Value& root) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    out << Json::writeString(builder, root) << "\n";
}

Json::Value parseErrorToJson(const ParseError& error) {
    Json::Value json;
    json["code"] = error.code();
    json["message"] = error.message();
    return json;
}

Json::Value generationErrorToJson(const GenerationError& error) {
    Json::Value json;
    json["code"] = error.code();
    json["message"] = error.message();
    return json;
}

Json::Value idToJson(const NationalId& id) {
    Json::Value json;
    json["id"] = id.toString();
    json["category"] = categoryToString(id.getCategory());
    json["checkDigit"] = static_cast<int>(id.getCheckDigit());
    return json;
}

// ---------------------------------------------------------------------------
// validate
// ---------------------------------------------------------------------------

int runValidate(const Options& opts, const config::ToolConfig& config,
                std::istream& in, std::ostream& out) {
    if (opts.operands.empty()) {
        throw UsageError("validate needs at least one ID (or - for stdin)");
    }

    std::vector<std::string> inputs;
    for (const auto& operand : opts.operands) {
        if (operand != "-") {
            inputs.push_back(operand);
            continue;
        }
        std::string line;
        while (std::getline(in, line)) {
            std::string candidate = trim(line);
            if (!candidate.empty()) {
                inputs.push_back(candidate);
            }
        }
    }

    size_t invalid = 0;
    Json::Value results(Json::arrayValue);

    for (const auto& input : inputs) {
        ParseResult result = NationalId::parse(input);

        if (config.jsonOutput()) {
            Json::Value entry;
            entry["input"] = input;
            entry["valid"] = result.ok();
            if (result.ok()) {
                entry["category"] = categoryToString(result.id->getCategory());
            } else {
                entry["error"] = parseErrorToJson(*result.error);
            }
            results.append(entry);
        } else if (result.ok()) {
            out << input << ": VALID " << categoryToString(result.id->getCategory()) << "\n";
        } else {
            out << input << ": INVALID " << result.error->code()
                << " (" << result.error->message() << ")\n";
        }

        if (!result.ok()) {
            ++invalid;
        }
    }

    if (config.jsonOutput()) {
        writeJson(out, results);
    }

    spdlog::info("Validated {} IDs, {} invalid", inputs.size(), invalid);
    return invalid == 0 ? EXIT_OK : EXIT_INVALID;
}

// ---------------------------------------------------------------------------
// generate
// ---------------------------------------------------------------------------

int runGenerate(const Options& opts, const config::ToolConfig& config,
                std::ostream& out, std::ostream& err) {
    if (!opts.operands.empty()) {
        throw UsageError("generate takes no operands");
    }

    size_t count = 1;
    if (opts.count) {
        if (!isAsciiDigits(*opts.count) || opts.count->length() > 9) {
            throw UsageError("count must be a positive integer, got '" + *opts.count + "'");
        }
        count = std::stoul(*opts.count);
        if (count == 0 || count > static_cast<size_t>(config.maxCount)) {
            throw UsageError("count must be between 1 and " + std::to_string(config.maxCount));
        }
    }

    Category category = opts.type.value_or(Category::CITIZEN);

    std::unique_ptr<IRandomSource> source = opts.seed
        ? makeRandomSource("seeded", *opts.seed)
        : makeRandomSource(config.randomSource, config.seed);

    NationalIdGenerator generator(source.get());
    BatchResult batch = generator.generateBatch(category, count);

    if (config.jsonOutput()) {
        Json::Value root;
        root["category"] = categoryToString(category);
        Json::Value ids(Json::arrayValue);
        for (const auto& id : batch.ids) {
            ids.append(id.toString());
        }
        root["ids"] = ids;
        if (batch.error) {
            root["error"] = generationErrorToJson(*batch.error);
        }
        writeJson(out, root);
    } else {
        for (const auto& id : batch.ids) {
            out << id.toString() << "\n";
        }
    }

    if (batch.error) {
        err << "error: " << batch.error->message() << "\n";
        spdlog::error("Generation failed: {}", batch.error->code());
        return EXIT_RANDOMNESS;
    }
    return EXIT_OK;
}

// ---------------------------------------------------------------------------
// check-digit
// ---------------------------------------------------------------------------

int runCheckDigit(const Options& opts, const config::ToolConfig& config,
                  std::ostream& out, std::ostream& err) {
    if (opts.operands.size() != 1) {
        throw UsageError("check-digit takes exactly one 9-digit payload");
    }

    const std::string& text = opts.operands[0];
    if (text.length() != PAYLOAD_LENGTH || !isAsciiDigits(text)) {
        throw UsageError("payload must be exactly 9 digits, got '" + text + "'");
    }

    Payload payload{};
    for (size_t i = 0; i < PAYLOAD_LENGTH; ++i) {
        payload[i] = static_cast<uint8_t>(text[i] - '0');
    }

    GenerationResult result = NationalIdGenerator::generateWithPayload(payload);

    if (config.jsonOutput()) {
        Json::Value root = result.ok() ? idToJson(*result.id) : Json::Value(Json::objectValue);
        root["payload"] = text;
        if (!result.ok()) {
            root["error"] = generationErrorToJson(*result.error);
        }
        writeJson(out, root);
    } else if (result.ok()) {
        out << result.id->toString() << "\n";
    }

    if (!result.ok()) {
        err << "error: " << result.error->message() << "\n";
        return EXIT_INVALID;
    }
    return EXIT_OK;
}

} // anonymous namespace

void printUsage(std::ostream& os) {
    os << "usage:\n"
       << "  saudi-id validate <id>... | -\n"
       << "  saudi-id generate [--type citizen|resident] [--count N] [--seed S]\n"
       << "  saudi-id check-digit <9-digit payload>\n"
       << "\n"
       << "options:\n"
       << "  --json                 JSON output\n"
       << "  --log-level <level>    trace|debug|info|warn|error|critical|off\n"
       << "  --help                 show this text\n"
       << "\n"
       << "environment:\n"
       << "  LOG_LEVEL, SAUDI_ID_LOG_FILE, SAUDI_ID_RANDOM_SOURCE (openssl|seeded),\n"
       << "  SAUDI_ID_SEED, SAUDI_ID_OUTPUT (text|json), SAUDI_ID_MAX_COUNT\n";
}

int run(const std::vector<std::string>& args,
        std::istream& in,
        std::ostream& out,
        std::ostream& err,
        config::ToolConfig config) {
    try {
        Options opts = parseArguments(args, config);

        if (opts.help || opts.command == "help") {
            printUsage(out);
            return EXIT_OK;
        }
        if (opts.command.empty()) {
            printUsage(err);
            return EXIT_USAGE;
        }

        config.validate();
        logging::Logger::setLevel(config.logLevel);

        if (opts.command == "validate") return runValidate(opts, config, in, out);
        if (opts.command == "generate") return runGenerate(opts, config, out, err);
        if (opts.command == "check-digit") return runCheckDigit(opts, config, out, err);

        throw UsageError("unknown command '" + opts.command + "'");

    } catch (const UsageError& e) {
        err << "error: " << e.what() << "\n";
        printUsage(err);
        return EXIT_USAGE;
    } catch (const ConfigException& e) {
        spdlog::error("{}", e.what());
        err << "error: " << e.what() << "\n";
        return EXIT_USAGE;
    }
}

} // namespace saudi_id::cli
