#include "utils/ReadReactionNetwork.hpp"
#include "network/NetworkBuilder.hpp"
#include "exceptions/NetworkParseException.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <vector>

using crn::NetworkParseException;
using ErrorType = crn::NetworkParseException::ErrorType;

namespace {

    const char* const kSource = "parseReactionNetwork";

    std::string where(const std::string& name, int line_number) {
        return name + ":" + std::to_string(line_number);
    }

    bool isIdentifier(const std::string& token) {
        if (token.empty() || !(std::isalpha(static_cast<unsigned char>(token[0])) || token[0] == '_')) {
            return false;
        }
        return std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isalnum(c) || c == '_'; });
    }

    bool tryParseDouble(const std::string& text, double& value) {
        try {
            size_t consumed = 0;
            value = std::stod(text, &consumed);
            return consumed == text.size();
        } catch (const std::logic_error&) {
            return false;
        }
    }

    double parseNumber(const std::string& text, const std::string& context) {
        double value = 0.0;
        if (!tryParseDouble(text, value) || !std::isfinite(value)) {
            throw NetworkParseException(ErrorType::InvalidNumberFormat, kSource, "'" + text + "' at " + context);
        }
        return value;
    }

    std::vector<std::string> split(const std::string& text, char delimiter) {
        std::vector<std::string> parts;
        std::string part;
        std::istringstream iss(text);
        while (std::getline(iss, part, delimiter)) {
            parts.push_back(FileUtils::trim(part));
        }
        if (!text.empty() && text.back() == delimiter) {
            parts.push_back("");
        }
        return parts;
    }

    // "0" or "[c] Name + [c] Name ..."; "2 X" and "2X" are both accepted.
    std::vector<std::pair<std::string, int>> parseSide(const std::string& side, const std::string& context) {
        std::vector<std::pair<std::string, int>> terms;
        const std::string text = FileUtils::trim(side);
        if (text.empty()) {
            throw NetworkParseException(ErrorType::MalformedReaction, kSource,
                                        "empty reaction side (use 0 for no species) at " + context);
        }
        if (text == "0") {
            return terms;
        }
        for (const auto& term : split(text, '+')) {
            if (term.empty()) {
                throw NetworkParseException(ErrorType::MalformedReaction, kSource, "dangling '+' at " + context);
            }
            size_t pos = 0;
            if (term[0] == '-' || term[0] == '+') ++pos;
            while (pos < term.size() && std::isdigit(static_cast<unsigned char>(term[pos]))) ++pos;

            int coefficient = 1;
            std::string species = term;
            if (pos > 0) {
                const std::string digits = term.substr(0, pos);
                try {
                    coefficient = std::stoi(digits);
                } catch (const std::logic_error&) {
                    throw NetworkParseException(ErrorType::InvalidCoefficient, kSource,
                                                "'" + digits + "' at " + context);
                }
                species = FileUtils::trim(term.substr(pos));
            }
            if (!isIdentifier(species)) {
                throw NetworkParseException(ErrorType::MalformedReaction, kSource,
                                            "'" + term + "' is not a valid species term at " + context);
            }
            terms.emplace_back(species, coefficient);
        }
        return terms;
    }

    std::vector<std::string> parseNameList(const std::string& text, const std::string& context) {
        std::vector<std::string> names;
        if (FileUtils::trim(text).empty()) {
            return names;
        }
        for (const auto& name : split(text, ',')) {
            if (!isIdentifier(name)) {
                throw NetworkParseException(ErrorType::InvalidRateExpression, kSource,
                                            "'" + name + "' is not a valid argument at " + context);
            }
            names.push_back(name);
        }
        return names;
    }

    crn::RateExpression parseRate(const std::string& rate_text, const std::string& context) {
        const std::string text = FileUtils::trim(rate_text);
        const auto open = text.find('(');
        if (open != std::string::npos) {
            if (text.back() != ')') {
                throw NetworkParseException(ErrorType::InvalidRateExpression, kSource,
                                            "missing ')' in '" + text + "' at " + context);
            }
            const std::string function_name = FileUtils::trim(text.substr(0, open));
            if (!isIdentifier(function_name)) {
                throw NetworkParseException(ErrorType::InvalidRateExpression, kSource,
                                            "'" + function_name + "' is not a function name at " + context);
            }
            const std::string arguments = text.substr(open + 1, text.size() - open - 2);
            const auto semicolon = arguments.find(';');
            const std::string species_part = semicolon == std::string::npos ? arguments : arguments.substr(0, semicolon);
            const std::string parameter_part = semicolon == std::string::npos ? "" : arguments.substr(semicolon + 1);
            return crn::RateExpression::library(function_name,
                                                parseNameList(species_part, context),
                                                parseNameList(parameter_part, context));
        }

        double constant = 0.0;
        if (tryParseDouble(text, constant)) {
            if (!std::isfinite(constant)) {
                throw NetworkParseException(ErrorType::InvalidNumberFormat, kSource, "'" + text + "' at " + context);
            }
            return crn::RateExpression::massAction(constant);
        }
        if (isIdentifier(text)) {
            return crn::RateExpression::massAction(text);
        }
        throw NetworkParseException(ErrorType::InvalidRateExpression, kSource, "'" + text + "' at " + context);
    }

    crn::ReactionClause parseReaction(const std::string& body, const std::string& context) {
        const auto colon = body.find(':');
        if (colon == std::string::npos) {
            throw NetworkParseException(ErrorType::MalformedReaction, kSource, "missing ':' at " + context);
        }
        const std::string equation = body.substr(colon + 1);
        const auto arrow = equation.find("->");
        if (arrow == std::string::npos) {
            throw NetworkParseException(ErrorType::MalformedReaction, kSource, "missing '->' at " + context);
        }

        crn::ReactionClause clause;
        clause.rate = parseRate(body.substr(0, colon), context);
        clause.reactants = parseSide(equation.substr(0, arrow), context);
        clause.products = parseSide(equation.substr(arrow + 2), context);
        return clause;
    }

    bool parseFlag(const std::string& text, const std::string& context) {
        if (text == "1" || text == "true") return true;
        if (text == "0" || text == "false") return false;
        throw NetworkParseException(ErrorType::InvalidNumberFormat, kSource,
                                    "expected 0, 1, true or false, got '" + text + "' at " + context);
    }

} // namespace

crn::NetworkDescription parseReactionNetwork(std::istream& input, const std::string& name) {
    crn::NetworkBuilder builder;
    std::map<std::string, double> parameter_values;
    std::map<std::string, double> initial_values;

    std::string line;
    int line_number = 0;
    while (std::getline(input, line)) {
        line_number++;
        const auto comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }
        line = FileUtils::trim(line);
        if (line.empty()) continue;

        const std::string context = where(name, line_number);
        std::istringstream iss(line);
        std::string directive;
        iss >> directive;

        if (directive == "reaction") {
            std::string body;
            std::getline(iss, body);
            builder.addReaction(parseReaction(body, context));
            continue;
        }

        std::vector<std::string> fields;
        std::string field;
        while (iss >> field) fields.push_back(field);

        if (directive == "parameter") {
            if (fields.size() != 2 || !isIdentifier(fields[0])) {
                throw NetworkParseException(ErrorType::InvalidNumberFormat, kSource,
                                            "expected 'parameter <name> <value>' at " + context);
            }
            builder.addParameter(fields[0]);
            parameter_values[fields[0]] = parseNumber(fields[1], context);
        } else if (directive == "species") {
            if (fields.empty() || fields.size() > 2 || !isIdentifier(fields[0])) {
                throw NetworkParseException(ErrorType::UnknownDirective, kSource,
                                            "expected 'species <name> [<initial>]' at " + context);
            }
            builder.addSpecies(fields[0]);
            if (fields.size() == 2) {
                initial_values[fields[0]] = parseNumber(fields[1], context);
            }
        } else if (directive == "initial") {
            if (fields.size() != 2 || !isIdentifier(fields[0])) {
                throw NetworkParseException(ErrorType::InvalidNumberFormat, kSource,
                                            "expected 'initial <species> <value>' at " + context);
            }
            initial_values[fields[0]] = parseNumber(fields[1], context);
        } else if (directive == "option") {
            if (fields.size() != 2 || fields[0] != "combinatoric_ratelaws") {
                throw NetworkParseException(ErrorType::UnknownDirective, kSource,
                                            "unsupported option '" + line + "' at " + context);
            }
            builder.setCombinatoricRateLaws(parseFlag(fields[1], context));
        } else {
            throw NetworkParseException(ErrorType::UnknownDirective, kSource, "'" + directive + "' at " + context);
        }
    }

    crn::NetworkDescription description;
    description.name = name;
    description.network = builder.build();
    description.parameters = description.network->parameterVector(parameter_values);
    description.initial_state = description.network->stateVector(initial_values);

    crn::Logger::getInstance().info(kSource,
                                    "Loaded network '" + name + "': " +
                                    std::to_string(description.network->getSpeciesCount()) + " species, " +
                                    std::to_string(description.network->getParameterCount()) + " parameters, " +
                                    std::to_string(description.network->getReactionCount()) + " reactions.");
    return description;
}

crn::NetworkDescription readReactionNetwork(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw NetworkParseException(ErrorType::FileOpenError, "readReactionNetwork", filename);
    }
    return parseReactionNetwork(file, std::filesystem::path(filename).stem().string());
}
