#include "CommandHandler.hpp"
#include "GeoCryptErrors.hpp"
#include "Parser.hpp"
#include "Precision.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

double parseDouble(const std::string& value, const char* what) {
    size_t used = 0;
    double result = 0;
    try {
        result = std::stod(value, &used);
    } catch (const std::logic_error&) {
        throw std::runtime_error(std::string("invalid ") + what + " '" + value + "'");
    }
    if (used != value.size()) {
        throw std::runtime_error(std::string("invalid ") + what + " '" + value + "'");
    }
    return result;
}

int parseInt(const std::string& value, const char* what) {
    size_t used = 0;
    int result = 0;
    try {
        result = std::stoi(value, &used);
    } catch (const std::logic_error&) {
        throw std::runtime_error(std::string("invalid ") + what + " '" + value + "'");
    }
    if (used != value.size()) {
        throw std::runtime_error(std::string("invalid ") + what + " '" + value + "'");
    }
    return result;
}

std::string formatDouble(double value) {
    std::ostringstream ss;
    ss << std::setprecision(17) << value;
    return ss.str();
}

}

CommandHandler::CommandHandler(std::ostream& out, const AdaptiveHash& primitive, std::string text)
    : out(out), hasher(primitive), text(std::move(text)) {}

bool CommandHandler::isGeoCryptCommand(const std::string& cmd) {
    return cmd == "HASH" || cmd == "COMPARE" || cmd == "GEOHASH" || cmd == "LOCATION" ||
           cmd == "ERROR" || cmd == "BITS" || cmd == "PREC" || cmd == "TEXT";
}

bool CommandHandler::handleMessage(const std::string& message) {
    Parser parser;
    try {
        Command cmd = parser.parse(message);
        return handleCommand(cmd.name, cmd.args);
    } catch (const std::exception& e) {
        sendError(e.what());
        return false;
    }
}

bool CommandHandler::handleCommand(const std::string& cmd, const std::vector<std::string>& args) {
    try {
        if (cmd == "HASH") handleHash(args);
        else if (cmd == "COMPARE") handleCompare(args);
        else if (cmd == "GEOHASH") handleGeohash(args);
        else if (cmd == "LOCATION") handleLocation(args);
        else if (cmd == "ERROR") handleError(args);
        else if (cmd == "BITS") handleBits(args);
        else if (cmd == "PREC") handlePrec(args);
        else if (cmd == "TEXT") handleText(args);
        else {
            sendError("Unknown command '" + cmd + "'");
            return false;
        }
    } catch (const std::exception& e) {
        sendError(e.what());
        return false;
    }
    return true;
}

void CommandHandler::handleHash(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        throw std::runtime_error("HASH requires latitude and longitude");
    }
    double latitude = parseDouble(args[0], "latitude");
    double longitude = parseDouble(args[1], "longitude");

    std::vector<int> precisions;
    for (size_t i = 2; i < args.size(); ++i) {
        precisions.push_back(parseInt(args[i], "precision"));
    }
    sendResponse(hasher.hash(latitude, longitude, text, precisions));
}

void CommandHandler::handleCompare(const std::vector<std::string>& args) {
    if (args.size() != 3) {
        throw std::runtime_error("COMPARE requires hash, latitude and longitude");
    }
    double latitude = parseDouble(args[1], "latitude");
    double longitude = parseDouble(args[2], "longitude");

    sendResponse(std::to_string(hasher.compare(args[0], latitude, longitude, text)));
}

void CommandHandler::handleGeohash(const std::vector<std::string>& args) {
    if (args.size() != 3) {
        throw std::runtime_error("GEOHASH requires latitude, longitude and bits");
    }
    double latitude = parseDouble(args[0], "latitude");
    double longitude = parseDouble(args[1], "longitude");
    int bits = parseInt(args[2], "bits");
    sendResponse(geohash(latitude, longitude, bits));
}

void CommandHandler::handleLocation(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        throw std::runtime_error("LOCATION requires a geohash");
    }
    GeoLocation loc = location(args[0]);
    sendResponse(formatDouble(loc.latitude) + " " + formatDouble(loc.longitude) + " " + std::to_string(loc.bits));
}

void CommandHandler::handleError(const std::vector<std::string>& args) {
    if (args.size() != 1 && args.size() != 3) {
        throw std::runtime_error("ERROR requires bits and an optional latitude and longitude");
    }
    int bits = parseInt(args[0], "bits");
    double latitude = 0;
    double longitude = 0;
    if (args.size() == 3) {
        latitude = parseDouble(args[1], "latitude");
        longitude = parseDouble(args[2], "longitude");
    }

    Coordinates err = errorBounds(bits);
    std::ostringstream resp;
    resp << std::setprecision(3) << std::scientific << err.latitude << " " << err.longitude << " "
         << std::fixed << std::setprecision(2) << diagonalError(latitude, longitude, bits);
    sendResponse(resp.str());
}

void CommandHandler::handleBits(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        throw std::runtime_error("BITS requires a precision");
    }
    int prec = parseInt(args[0], "precision");
    if (prec < MIN_PRECISION || prec > MAX_PRECISION) {
        throw InvalidPrecisionError(prec);
    }
    sendResponse(std::to_string(bitsForPrecision(prec)));
}

void CommandHandler::handlePrec(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        throw std::runtime_error("PREC requires a bit count");
    }
    sendResponse(std::to_string(precisionForBits(parseInt(args[0], "bits"))));
}

void CommandHandler::handleText(const std::vector<std::string>& args) {
    std::string joined;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i != 0) joined += ' ';
        joined += args[i];
    }
    if (joined.size() > MAX_TEXT_LENGTH) {
        throw TextTooLongError(joined.size());
    }
    text = joined;
    sendResponse("OK");
}

void CommandHandler::sendResponse(const std::string& response) {
    out << "+" << response << "\n";
}

void CommandHandler::sendError(const std::string& message) {
    out << "-ERR " << message << "\n";
}
