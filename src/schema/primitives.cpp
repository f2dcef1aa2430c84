#include <procura/schema/primitives.hpp>

#include <chrono>
#include <iterator>
#include <string_view>

namespace procura::schema {

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string format_amount(const amount_t amount) {
  auto whole = std::to_string(amount / 100);
  auto grouped = std::string{};
  grouped.reserve(whole.size() + (whole.size() / 3));
  for (size_t i = 0; i < whole.size(); ++i) {
    if (i != 0 && ((whole.size() - i) % 3) == 0) {
      grouped.push_back(',');
    }
    grouped.push_back(whole[i]);
  }
  auto cents = amount % 100;
  auto out = std::string{"$"};
  out.append(grouped);
  out.push_back('.');
  out.push_back(static_cast<char>('0' + (cents / 10)));
  out.push_back(static_cast<char>('0' + (cents % 10)));
  return out;
}

timestamp_milliseconds_t now_milliseconds() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace procura::schema
