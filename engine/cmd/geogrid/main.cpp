#include <getopt.h>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "config/config.hpp"
#include "db/index/spatial/geo_grid.hpp"
#include "logger/logger.hpp"
#include "utils/status.hpp"

using geogrid::engine::index::GeoCandidate;
using geogrid::engine::index::GeoGrid;
using geogrid::engine::index::GeoPoint;

void print_help(const std::string &app_name) {
  std::cout << std::endl
            << "Usage: " << app_name << " -f FILE [OPTIONS] (-k KEY | -P LAT,LNG)" << std::endl
            << std::endl;
  std::cout << "  Options:" << std::endl;
  std::cout << "   -h --help                 Print this help." << std::endl;
  std::cout << "   -f --file filename        CSV file with key,lat,lng rows." << std::endl;
  std::cout << "   -p --precision level      Grid precision, 1 to 8." << std::endl;
  std::cout << "   -r --radius km            Search radius, also selects the precision." << std::endl;
  std::cout << "   -k --near_key key         Find keys near an indexed key." << std::endl;
  std::cout << "   -P --near_point lat,lng   Find keys near a point." << std::endl;
  std::cout << "   -n --closest count        With --near_point, find the closest keys instead." << std::endl;
  std::cout << "   -d --double_check         Refine candidates with exact distances." << std::endl;
  std::cout << "   -q --quiet                Do not report grid setup and skipped rows." << std::endl;
  std::cout << std::endl;
}

bool parse_point(const std::string &text, GeoPoint &point) {
  std::istringstream stream(text);
  char comma = 0;
  if (!(stream >> point.latitude >> comma >> point.longitude) || comma != ',') {
    return false;
  }
  return stream.eof() || (stream >> std::ws).eof();
}

// Positive decimal count; rejects signs, trailing text and overflow.
bool parse_count(const char *text, size_t &count) {
  if (text == nullptr || *text < '0' || *text > '9') {
    return false;
  }
  char *end;
  errno = 0;
  unsigned long long value = std::strtoull(text, &end, 10);
  if (errno == ERANGE || *end != '\0' || value == 0 || value > std::numeric_limits<size_t>::max()) {
    return false;
  }
  count = static_cast<size_t>(value);
  return true;
}

geogrid::Status load_csv(const std::string &path, GeoGrid &grid, geogrid::engine::Logger &logger) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return geogrid::Status(geogrid::INFRA_FILE_OPEN_ERROR, "Cannot open file: " + path);
  }

  std::string line;
  size_t line_number = 0;
  size_t loaded = 0;
  while (std::getline(file, line)) {
    ++line_number;
    if (line.empty() || line[0] == '#') {
      continue;
    }
    auto first = line.find(',');
    GeoPoint point;
    if (first == std::string::npos || !parse_point(line.substr(first + 1), point)) {
      logger.Warning("Malformed row at line " + std::to_string(line_number) + ", skipping.");
      continue;
    }
    if (grid.Insert(line.substr(0, first), point).ok()) {
      ++loaded;
    }
  }
  logger.Info("Loaded " + std::to_string(loaded) + " points from " + path);
  return geogrid::Status::OK();
}

int main(int argc, char *argv[]) {
  geogrid::engine::Logger logger;

  static struct option long_options[] = {{"help", no_argument, nullptr, 'h'},
                                         {"file", required_argument, nullptr, 'f'},
                                         {"precision", required_argument, nullptr, 'p'},
                                         {"radius", required_argument, nullptr, 'r'},
                                         {"near_key", required_argument, nullptr, 'k'},
                                         {"near_point", required_argument, nullptr, 'P'},
                                         {"closest", required_argument, nullptr, 'n'},
                                         {"double_check", no_argument, nullptr, 'd'},
                                         {"quiet", no_argument, nullptr, 'q'},
                                         {nullptr, 0, nullptr, 0}};

  int option_index = 0;
  int value;

  std::string app_name = argv[0];
  std::string filename;
  std::optional<std::string> near_key;
  std::optional<GeoPoint> near_point;
  std::optional<size_t> closest;
  bool double_check = false;
  geogrid::GridConfig config = geogrid::GridConfig::FromEnv();

  while ((value = getopt_long(argc, argv, "hf:p:r:k:P:n:dq", long_options, &option_index)) != -1) {
    switch (value) {
      case 'f':
        filename = optarg;
        break;
      case 'p':
        config.precision = std::atoi(optarg);
        break;
      case 'r':
        config.radius = std::atof(optarg);
        break;
      case 'k':
        near_key = std::string(optarg);
        break;
      case 'P': {
        GeoPoint point;
        if (!parse_point(optarg, point)) {
          std::cerr << "Invalid point: " << optarg << std::endl;
          return EXIT_FAILURE;
        }
        near_point = point;
        break;
      }
      case 'n': {
        size_t count = 0;
        if (!parse_count(optarg, count)) {
          std::cerr << "Invalid count: " << optarg << std::endl;
          print_help(app_name);
          return EXIT_FAILURE;
        }
        closest = count;
        break;
      }
      case 'd':
        double_check = true;
        break;
      case 'q':
        config.verbose = false;
        break;
      case 'h':
        print_help(app_name);
        return EXIT_SUCCESS;
      default:
        print_help(app_name);
        return EXIT_FAILURE;
    }
  }

  if (filename.empty() || (!near_key.has_value() && !near_point.has_value())) {
    print_help(app_name);
    return EXIT_FAILURE;
  }
  if (closest.has_value() && (near_key.has_value() || !near_point.has_value())) {
    std::cerr << "--closest needs --near_point and cannot be combined with --near_key" << std::endl;
    print_help(app_name);
    return EXIT_FAILURE;
  }

  double radius = config.radius.value_or(0);
  try {
    GeoGrid grid(config);
    if (!config.radius.has_value()) {
      radius = grid.AverageRadius();
    }

    auto status = load_csv(filename, grid, logger);
    if (!status.ok()) {
      logger.Error(status.ToString());
      return EXIT_FAILURE;
    }

    std::vector<GeoCandidate> results;
    if (near_key.has_value()) {
      status = grid.FindNearKey(near_key.value(), radius, double_check, results);
    } else if (closest.has_value()) {
      status = grid.FindClosestFromPoint(near_point.value(), closest.value(), double_check, std::nullopt, results);
    } else {
      status = grid.FindNearPoint(near_point, radius, double_check, results);
    }
    if (!status.ok()) {
      logger.Error(status.ToString());
      return EXIT_FAILURE;
    }

    for (const auto &result : results) {
      std::cout << result.distance << "\t" << result.key << std::endl;
    }
  } catch (const geogrid::engine::GeoGridException &e) {
    logger.Error(std::string("Invalid grid configuration: ") + e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
