#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <random>

namespace {

constexpr std::string_view kBase36 = "0123456789abcdefghijklmnopqrstuvwxyz";
constexpr std::string_view kSessionAlphabet =
  "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789_-";

std::string to_base36(uint64_t value) {
  if(value == 0) return "0";
  std::string out;
  while(value > 0) {
    out.push_back(kBase36[value % 36]);
    value /= 36;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

} // namespace

int64_t now_ms(){
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string random_token(std::size_t length, std::string_view alphabet){
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<std::size_t> dist(0, alphabet.size() - 1);
  std::string out;
  out.reserve(length);
  for(std::size_t i = 0; i < length; ++i) out.push_back(alphabet[dist(rng)]);
  return out;
}

std::string generate_peer_id(){
  return to_base36(static_cast<uint64_t>(now_ms())) + "-" + random_token(7, kBase36);
}

std::string generate_session_id(){
  return random_token(12, kSessionAlphabet);
}

bool is_valid_session_id(const std::string& id){
  if(id.size() < 8 || id.size() > 16) return false;
  return std::all_of(id.begin(), id.end(), [](unsigned char ch){
    return std::isalnum(ch) || ch == '_' || ch == '-';
  });
}

std::string normalize_relative_path(const std::string& input){
  if(input.empty()) return "";
  std::string out = input;
  std::replace(out.begin(), out.end(), '\\', '/');
  out.erase(out.begin(), std::find_if(out.begin(), out.end(), [](unsigned char ch){ return !std::isspace(ch); }));
  out.erase(std::find_if(out.rbegin(), out.rend(), [](unsigned char ch){ return !std::isspace(ch); }).base(), out.end());
  while(!out.empty() && out.front() == '/') out.erase(out.begin());
  while(!out.empty() && out.back() == '/') out.pop_back();
  while(out.rfind("./", 0) == 0) out.erase(0, 2);
  if(out == ".") return "";
  return out;
}

bool is_safe_relative_path(const std::string& path){
  if(path.empty()) return false;
  if(path.front() == '/' || path.find('\\') != std::string::npos) return false;
  std::filesystem::path p(path);
  if(p.is_absolute()) return false;
  for(const auto& part : p) {
    if(part == "..") return false;
  }
  return true;
}

std::string filename_timestamp(int64_t epoch_ms){
  std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H-%M-%S", &utc);
  return buf;
}
