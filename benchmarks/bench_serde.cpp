#include "bench_main.hpp"
#include "binjson/binjson.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

using namespace binjson;
using serde::field;
using serde::fields;

namespace {

struct Sample {
  std::uint32_t id{0};
  std::string name;
  double value{0.0};
  std::optional<std::string> unit;
  std::vector<std::int32_t> history;

  template <class Self>
  static auto describe(Self& self) {
    return fields(field("id", self.id), field("name", self.name), field("value", self.value),
                  field("unit", self.unit), field("history", self.history));
  }
};

struct Started {
  static constexpr std::string_view tag = "Started";
};

struct Measured {
  static constexpr std::string_view tag = "Measured";
  Sample value;
};

struct Failed {
  static constexpr std::string_view tag = "Failed";
  std::uint16_t code{0};
  std::string reason;

  template <class Self>
  static auto describe(Self& self) {
    return fields(field("code", self.code), field("reason", self.reason));
  }
};

using Event = std::variant<Started, Measured, Failed>;
using Table = std::map<std::string, std::vector<double>>;

std::vector<Event> make_events(std::size_t count) {
  std::vector<Event> events;
  events.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    switch (i % 3) {
    case 0:
      events.emplace_back(Started{});
      break;
    case 1: {
      Sample s;
      s.id = static_cast<std::uint32_t>(i);
      s.name = "sensor_" + std::to_string(i % 17);
      s.value = static_cast<double>(i) * 0.25;
      if (i % 2 == 0) {
        s.unit = "mV";
      }
      s.history = {1, -2, 3, -4, 5};
      events.emplace_back(Measured{std::move(s)});
      break;
    }
    default:
      events.emplace_back(Failed{static_cast<std::uint16_t>(i), "timeout"});
      break;
    }
  }
  return events;
}

} // namespace

static void bench_serde_events() {
  constexpr std::size_t count = 3000;
  const auto events = make_events(count);

  Value tree;
  BENCH_RUN("serde: to_value (3000 events)", count, 5, {
    auto err = to_value(events, tree);
    if (err) {
      std::cerr << "to_value failed: " << err.message() << "\n";
    }
  });

  BENCH_RUN("serde: from_value (3000 events)", count, 5, {
    std::vector<Event> decoded;
    auto err = from_value(tree, decoded);
    if (err) {
      std::cerr << "from_value failed: " << err.message() << "\n";
    }
  });

  std::vector<byte> bytes;
  BENCH_RUN("serde: to_bytes (3000 events)", count, 5, {
    bytes.clear();
    auto err = to_bytes(events, bytes);
    if (err) {
      std::cerr << "to_bytes failed: " << err.message() << "\n";
    }
  });

  BENCH_RUN("serde: from_bytes (3000 events)", bytes.size(), 5, {
    std::vector<Event> decoded;
    auto err = from_bytes(bytes, decoded);
    if (err) {
      std::cerr << "from_bytes failed: " << err.message() << "\n";
    }
  });
}

static void bench_serde_map() {
  constexpr std::size_t count = 5000;
  Table table;
  for (std::size_t i = 0; i < count; ++i) {
    table["row_" + std::to_string(i)] = {static_cast<double>(i), 0.5, -1.0};
  }

  std::vector<byte> bytes;
  BENCH_RUN("serde: map to_bytes (5000 rows)", count, 5, {
    bytes.clear();
    auto err = to_bytes(table, bytes);
    if (err) {
      std::cerr << "to_bytes failed: " << err.message() << "\n";
    }
  });

  BENCH_RUN("serde: map from_bytes (5000 rows)", bytes.size(), 5, {
    Table decoded;
    auto err = from_bytes(bytes, decoded);
    if (err) {
      std::cerr << "from_bytes failed: " << err.message() << "\n";
    }
  });
}

int main() {
  bench_serde_events();
  bench_serde_map();

  binjson::benchmarks::print_results();
  return 0;
}
