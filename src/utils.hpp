#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

int64_t now_ms();

std::string random_token(std::size_t length, std::string_view alphabet);
std::string generate_peer_id();
std::string generate_session_id();
bool is_valid_session_id(const std::string& id);

// Strips whitespace, leading "/" and "./", trailing "/"; converts "\" to "/".
std::string normalize_relative_path(const std::string& input);
// Rejects empty paths, absolute paths and any ".." component.
bool is_safe_relative_path(const std::string& path);

// UTC "YYYY-MM-DDTHH-MM-SS", safe to embed in a file name.
std::string filename_timestamp(int64_t epoch_ms);

// Shared cancellation flag. Copies observe the same flag; tasks poll it at
// their suspension points.
class CancelToken {
public:
  CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const { flag_->store(true); }
  bool cancelled() const { return flag_->load(); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

// Overload set for std::visit.
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
