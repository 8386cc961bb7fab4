#pragma once

/**
 * @file result.hpp
 * @brief Value-or-error return type used by every fallible operation
 *
 * Errors are carried as human readable messages that name the file or
 * option responsible. Callers check isOk()/isError() before touching
 * value() or error().
 */

#include <string>
#include <utility>
#include <variant>

namespace ResourceMover {

template <typename T> class Result {
public:
  [[nodiscard]] static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

  [[nodiscard]] static Result error(std::string message) {
    return Result(std::in_place_index<1>, std::move(message));
  }

  [[nodiscard]] bool isOk() const { return m_data.index() == 0; }
  [[nodiscard]] bool isError() const { return m_data.index() == 1; }

  [[nodiscard]] T& value() & { return std::get<0>(m_data); }
  [[nodiscard]] const T& value() const& { return std::get<0>(m_data); }
  [[nodiscard]] T&& value() && { return std::get<0>(std::move(m_data)); }

  [[nodiscard]] const std::string& error() const { return std::get<1>(m_data); }

private:
  template <std::size_t I, typename... Args>
  explicit Result(std::in_place_index_t<I> tag, Args&&... args)
      : m_data(tag, std::forward<Args>(args)...) {}

  std::variant<T, std::string> m_data;
};

template <> class Result<void> {
public:
  [[nodiscard]] static Result ok() { return Result(true, {}); }

  [[nodiscard]] static Result error(std::string message) {
    return Result(false, std::move(message));
  }

  [[nodiscard]] bool isOk() const { return m_ok; }
  [[nodiscard]] bool isError() const { return !m_ok; }

  [[nodiscard]] const std::string& error() const { return m_error; }

private:
  Result(bool ok, std::string message) : m_ok(ok), m_error(std::move(message)) {}

  bool m_ok;
  std::string m_error;
};

} // namespace ResourceMover
