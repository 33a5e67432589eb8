#ifndef PARSE_INPUT_HPP
#define PARSE_INPUT_HPP

#include "game/game_types.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class InputErrorType : std::uint8_t {
    MalformedLine,
    InvalidCardCode
};

struct InputError {
    InputErrorType type;
    int lineNumber; // 0 when the input did not come from a numbered line
    std::string message;
};

struct Showdown {
    Hand hand1;
    Hand hand2;
};

std::string getInputErrorTypeName(InputErrorType type);

Result<Hand, InputError> buildHandFromStrings(const std::vector<std::string>& cardStrings, int lineNumber = 0);

// Blank lines produce std::nullopt
Result<std::optional<Showdown>, InputError> parseShowdownLine(const std::string& line, int lineNumber = 0);

// Ten comma separated cards, for example "AH,KH,QH,JH,TH,9C,9D,9S,9H,2C"
Result<Showdown, InputError> buildShowdownFromString(const std::string& showdownString);

#endif // PARSE_INPUT_HPP
