#pragma once
#include "util/common.h++"
#include <functional>

namespace Tessera {
  // Created once per unit of work (an HTTP request, a job) by the hosting
  // service. Calls the injected generator exactly once and prefixes every log
  // line with the resulting ID. If the generator throws, so does the
  // constructor; a tag never holds a made-up ID.
  class RequestTag {
  public:
    using Generator = std::function<std::string ()>;
  private:
    std::string _id;
  public:
    explicit RequestTag(const Generator& generate);

    auto id() const noexcept -> std::string_view { return _id; }

    template <typename... Args>
    auto log(spdlog::level::level_enum level, fmt::format_string<Args...> format, Args&&... args) const -> void {
      auto* logger = spdlog::default_logger_raw();
      if (!logger->should_log(level)) return;
      logger->log(level, "[{}] {}", _id, fmt::format(format, std::forward<Args>(args)...));
    }
    template <typename... Args>
    auto debug(fmt::format_string<Args...> format, Args&&... args) const -> void {
      log(spdlog::level::debug, format, std::forward<Args>(args)...);
    }
    template <typename... Args>
    auto info(fmt::format_string<Args...> format, Args&&... args) const -> void {
      log(spdlog::level::info, format, std::forward<Args>(args)...);
    }
    template <typename... Args>
    auto warn(fmt::format_string<Args...> format, Args&&... args) const -> void {
      log(spdlog::level::warn, format, std::forward<Args>(args)...);
    }
    template <typename... Args>
    auto error(fmt::format_string<Args...> format, Args&&... args) const -> void {
      log(spdlog::level::err, format, std::forward<Args>(args)...);
    }
  };
}
