#ifndef HAND_OUTPUT_HPP
#define HAND_OUTPUT_HPP

#include "history/hand_history.hpp"
#include "history/street_texture.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <string>

using json = nlohmann::ordered_json;

json buildStreetJSON(const StreetTexture& street);
json buildHandJSON(const HandHistory& hand);
Result<void> outputHandToJSON(const HandHistory& hand, const std::string& filePath, int indent);

#endif // HAND_OUTPUT_HPP
