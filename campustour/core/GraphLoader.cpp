#include "GraphLoader.hpp"

#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "Debug.hpp"

namespace CampusTour {

using namespace TourType;

namespace {

struct Line {
  int number;
  std::vector<std::string> tokens;
};

// Whitespace separated, "double quoted" tokens may contain spaces
std::vector<std::string> tokenize(const std::string &text, int lineNo,
                                  const std::string &source) {
  std::vector<std::string> tokens;
  size_t i = 0;
  while (i < text.size()) {
    char c = text[i];
    if (c == '#') {
      break;
    }
    if (std::isspace(static_cast<unsigned char>(c))) {
      ++i;
      continue;
    }
    std::string tok;
    if (c == '"') {
      size_t close = text.find('"', i + 1);
      if (close == std::string::npos) {
        throw GraphLoadError(source + ":" + std::to_string(lineNo) +
                             ": unterminated quoted string");
      }
      tok = text.substr(i + 1, close - i - 1);
      i = close + 1;
    } else {
      while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i])) &&
             text[i] != '#') {
        tok += text[i++];
      }
    }
    tokens.push_back(tok);
  }
  return tokens;
}

class Parser {
public:
  explicit Parser(const std::string &source) : m_source(source) {
    m_data.overrides = AngleOverrideTable::builtin();
  }

  void feed(const Line &line);
  TourData finish();

private:
  std::string m_source;
  TourData m_data;

  std::vector<Location> m_locations;
  std::unordered_map<std::string, std::string> m_buildingNames;
  std::unordered_set<std::string> m_seenIds;
  std::vector<AngleOverride> m_fileOverrides;

  std::optional<Location> m_block;
  int m_blockLine = 0;
  bool m_explicitBuilding = false;
  bool m_explicitFloor = false;

  [[noreturn]] void fail(int lineNo, const std::string &what) const {
    throw GraphLoadError(m_source + ":" + std::to_string(lineNo) + ": " + what);
  }

  void expectArgs(const Line &line, size_t minCount) const {
    if (line.tokens.size() < minCount + 1) {
      fail(line.number, "'" + line.tokens[0] + "' needs " + std::to_string(minCount) +
                            " argument(s)");
    }
  }

  float toFloat(const std::string &tok, int lineNo) const {
    std::istringstream is(tok);
    float value;
    is >> value;
    if (is.fail() || !is.eof()) {
      fail(lineNo, "bad number '" + tok + "'");
    }
    return value;
  }

  int toInt(const std::string &tok, int lineNo) const {
    std::istringstream is(tok);
    int value;
    is >> value;
    if (is.fail() || !is.eof()) {
      fail(lineNo, "bad integer '" + tok + "'");
    }
    return value;
  }

  Direction toDirection(const std::string &tok, int lineNo) const {
    auto dir = parseDirection(tok);
    if (!dir) {
      fail(lineNo, "unknown direction '" + tok + "'");
    }
    return *dir;
  }

  Vec3 toVec3(const Line &line, size_t first) const {
    return {toFloat(line.tokens[first], line.number),
            toFloat(line.tokens[first + 1], line.number),
            toFloat(line.tokens[first + 2], line.number)};
  }

  std::string restOfLine(const Line &line, size_t first) const {
    std::string text;
    for (size_t i = first; i < line.tokens.size(); ++i) {
      if (!text.empty()) text += ' ';
      text += line.tokens[i];
    }
    return text;
  }

  void topLevel(const Line &line);
  void blockStatement(const Line &line);
  void openBlock(const Line &line, bool hub);
  void closeBlock();
  void applyConfig(const Line &line);
};

void Parser::feed(const Line &line) {
  if (m_block) {
    blockStatement(line);
  } else {
    topLevel(line);
  }
}

void Parser::topLevel(const Line &line) {
  const std::string &keyword = line.tokens[0];
  if (keyword == "config") {
    applyConfig(line);
  } else if (keyword == "building") {
    expectArgs(line, 2);
    m_buildingNames[line.tokens[1]] = line.tokens[2];
  } else if (keyword == "location") {
    openBlock(line, false);
  } else if (keyword == "hub") {
    openBlock(line, true);
  } else if (keyword == "override") {
    expectArgs(line, 3);
    AngleOverride entry{line.tokens[1], toDirection(line.tokens[2], line.number),
                        toFloat(line.tokens[3], line.number)};
    m_fileOverrides.push_back(entry);
    m_data.overrides.add(entry);
  } else if (keyword == "end") {
    fail(line.number, "'end' without an open block");
  } else {
    fail(line.number, "unknown keyword '" + keyword + "'");
  }
}

void Parser::applyConfig(const Line &line) {
  expectArgs(line, 2);
  const std::string &key = line.tokens[1];
  const std::string &value = line.tokens[2];
  TourConfig &cfg = m_data.config;
  if (key == "entry") {
    cfg.entryLocationId = value;
  } else if (key == "secondsPerHop") {
    cfg.secondsPerHop = toFloat(value, line.number);
  } else if (key == "corridorTolerance") {
    cfg.corridorTolerance = toFloat(value, line.number);
  } else if (key == "directionTolerance") {
    cfg.directionTolerance = toFloat(value, line.number);
  } else if (key == "facingTolerance") {
    cfg.facingTolerance = toFloat(value, line.number);
  } else if (key == "logLevel") {
    cfg.logLevel = value;
  } else {
    fail(line.number, "unknown config key '" + key + "'");
  }
}

void Parser::openBlock(const Line &line, bool hub) {
  expectArgs(line, 1);
  const std::string &id = line.tokens[1];
  if (!m_seenIds.insert(id).second) {
    fail(line.number, "duplicate location id '" + id + "'");
  }
  Location loc;
  loc.id = id;
  loc.isHub = hub;
  if (hub) {
    loc.hubName = line.tokens.size() > 2 ? line.tokens[2] : id;
  }
  m_block = std::move(loc);
  m_blockLine = line.number;
  m_explicitBuilding = false;
  m_explicitFloor = false;
}

void Parser::closeBlock() {
  Location &loc = *m_block;
  auto [building, floor] = buildingAndFloorFromId(loc.id);
  if (!m_explicitBuilding) loc.buildingId = building;
  if (!m_explicitFloor) loc.floor = floor;
  LOG_TRACE("parsed " << (loc.isHub ? "hub " : "location ") << loc.id << " ("
                      << loc.edges.size() << " edges)");
  m_locations.push_back(std::move(loc));
  m_block.reset();
}

void Parser::blockStatement(const Line &line) {
  const std::string &keyword = line.tokens[0];
  Location &loc = *m_block;

  if (keyword == "end") {
    closeBlock();
  } else if (keyword == "location" || keyword == "hub") {
    fail(line.number, "block opened at line " + std::to_string(m_blockLine) +
                          " is missing 'end'");
  } else if (keyword == "image") {
    expectArgs(line, 1);
    loc.imageUrl = line.tokens[1];
  } else if (keyword == "heading") {
    expectArgs(line, 1);
    loc.baseHeading = toFloat(line.tokens[1], line.number);
  } else if (keyword == "building") {
    expectArgs(line, 1);
    loc.buildingId = line.tokens[1];
    m_explicitBuilding = true;
  } else if (keyword == "floor") {
    expectArgs(line, 1);
    loc.floor = toInt(line.tokens[1], line.number);
    m_explicitFloor = true;
  } else if (keyword == "wing") {
    expectArgs(line, 1);
    loc.wing = line.tokens[1];
  } else if (keyword == "hotspot") {
    expectArgs(line, 4);
    Hotspot spot;
    spot.direction = toDirection(line.tokens[1], line.number);
    spot.position = toVec3(line, 2);
    if (line.tokens.size() > 5) spot.destination = line.tokens[5];
    loc.hotspots.push_back(spot);
  } else if (keyword == "button") {
    expectArgs(line, 4);
    if (!loc.isHub) {
      fail(line.number, "'button' is only allowed inside a hub");
    }
    loc.floorButtons.push_back({toInt(line.tokens[1], line.number), toVec3(line, 2)});
  } else if (keyword == "room") {
    expectArgs(line, 1);
    loc.nearbyRooms.push_back(restOfLine(line, 1));
  } else if (keyword == "facility") {
    expectArgs(line, 1);
    loc.facilities.push_back(restOfLine(line, 1));
  } else if (auto dir = parseDirection(keyword)) {
    expectArgs(line, 1);
    if (loc.hasEdge(*dir)) {
      fail(line.number, "'" + keyword + "' given twice for " + loc.id);
    }
    if (line.tokens.size() == 2) {
      loc.edges.emplace(*dir, Edge(line.tokens[1]));
    } else {
      loc.edges.emplace(*dir, Edge(std::vector<std::string>(line.tokens.begin() + 1,
                                                            line.tokens.end())));
    }
  } else {
    fail(line.number, "unknown keyword '" + keyword + "' in block of " + loc.id);
  }
}

TourData Parser::finish() {
  if (m_block) {
    fail(m_blockLine, "block for '" + m_block->id + "' is missing 'end'");
  }

  m_data.graph = LocationGraph(std::move(m_locations), std::move(m_buildingNames),
                               m_data.config.entryLocationId);

  auto problems = m_data.graph.validate();
  for (const auto &entry : m_fileOverrides) {
    if (!m_data.graph.getById(entry.locationId)) {
      problems.push_back("override for unknown location '" + entry.locationId + "'");
    }
  }
  if (!problems.empty()) {
    std::string message = m_source + ": invalid graph";
    for (const auto &p : problems) {
      message += "\n  " + p;
    }
    throw GraphLoadError(message);
  }

  if (m_data.config.entryLocationId.empty()) {
    m_data.config.entryLocationId = m_data.graph.entryId();
  }
  LOG_INFO("Loaded " << m_data.graph.size() << " locations from " << m_source
                     << ", entry " << m_data.graph.entryId());
  return std::move(m_data);
}

} // namespace

///////////////////////////////////////////////////////////////////////////////

std::pair<std::string, int> buildingAndFloorFromId(const std::string &id) {
  std::vector<std::string> parts;
  std::istringstream is(id);
  std::string part;
  while (std::getline(is, part, '-')) {
    parts.push_back(part);
  }
  if (parts.empty()) {
    return {"", 0};
  }

  int floor = 0;
  if (parts.size() > 1 && parts[1].size() > 1 && parts[1][0] == 'f') {
    const std::string digits = parts[1].substr(1);
    bool numeric = digits.size() <= 3;
    for (char c : digits) {
      if (!std::isdigit(static_cast<unsigned char>(c))) numeric = false;
    }
    if (numeric) floor = std::stoi(digits);
  }
  return {parts[0], floor};
}

TourData parseGraph(std::istream &in, const std::string &sourceName) {
  Parser parser(sourceName);
  std::string text;
  int lineNo = 0;
  while (std::getline(in, text)) {
    ++lineNo;
    Line line{lineNo, tokenize(text, lineNo, sourceName)};
    if (!line.tokens.empty()) {
      parser.feed(line);
    }
  }
  return parser.finish();
}

TourData readGraphFromFile(const std::string &filename) {
  std::ifstream inFile(filename);
  if (!inFile) {
    throw GraphLoadError("Could not open graph file '" + filename + "'");
  }
  return parseGraph(inFile, filename);
}

} // namespace CampusTour
