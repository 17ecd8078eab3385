#pragma once
#include "AdaptiveHash.hpp"
#include "LocationHasher.hpp"
#include <ostream>
#include <string>
#include <vector>

// Runs geocrypt commands and writes "+<value>" or "-ERR <message>" lines.
class CommandHandler {
public:
    CommandHandler(std::ostream& out, const AdaptiveHash& primitive, std::string text = "");

    bool isGeoCryptCommand(const std::string& cmd);

    // Both return false when the command failed; the error has been reported.
    bool handleMessage(const std::string& message);
    bool handleCommand(const std::string& cmd, const std::vector<std::string>& args);

    const std::string& noteText() const { return text; }

private:
    std::ostream& out;
    LocationHasher hasher;
    std::string text;

    void handleHash(const std::vector<std::string>& args);
    void handleCompare(const std::vector<std::string>& args);
    void handleGeohash(const std::vector<std::string>& args);
    void handleLocation(const std::vector<std::string>& args);
    void handleError(const std::vector<std::string>& args);
    void handleBits(const std::vector<std::string>& args);
    void handlePrec(const std::vector<std::string>& args);
    void handleText(const std::vector<std::string>& args);
    void sendResponse(const std::string& response);
    void sendError(const std::string& message);
};
