#pragma once
#include "cm/drawing/Drawing.hpp"
#include <string>
#include <vector>

namespace cm {

// JSON array of drawing records:
//   [{"id":1,"type":"segment","points":[{"index":10,"price":100},...],
//     "config":{},"color":"#FFFFFF","lineWidth":1,"visible":true,"locked":false}]
std::string encodeDrawings(const std::vector<Drawing>& drawings);

// Returns false if the text is not a JSON array. Malformed records
// (unknown type, bad point count) are skipped and logged; records with a
// missing, zero, unparsable or duplicate id receive a fresh id.
bool decodeDrawings(const std::string& json, std::vector<Drawing>& out);

} // namespace cm
