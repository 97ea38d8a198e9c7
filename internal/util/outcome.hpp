#pragma once

#include <exception>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "internal/util/errors.hpp"

namespace hsm::util {

/*
  Outcome<T>

  Result of a computation that may have failed with an exception.
  Holds exactly one of:
    Success  -> a T
    Failure  -> the std::exception_ptr that was raised

  Used to carry results across worker/delivery thread hops without
  letting exceptions escape a thread.

      auto r = Outcome<int>::Attempt([] { return Parse(text); });
      r.Map([](int v) { return v * 2; })
       .Recover([](std::exception_ptr) { return 0; });

  Map only transforms a Success; a Failure passes through untouched and can
  only be turned back into a value with Recover.
*/
template <typename T>
class Outcome {
  static_assert(!std::is_same_v<T, std::exception_ptr>, "Outcome value type cannot be std::exception_ptr");
  static_assert(!std::is_void_v<T>, "Outcome<void> is not supported");

 public:
  using value_type = T;

  static Outcome Success(T value) {
    return Outcome(std::in_place_index<0>, std::move(value));
  }

  static Outcome Failure(std::exception_ptr error) {
    if (!error) {
      error = std::make_exception_ptr(InvalidState("Outcome::Failure constructed without an error"));
    }
    return Outcome(std::in_place_index<1>, std::move(error));
  }

  template <typename E>
  static Outcome Fail(E error) {
    return Failure(std::make_exception_ptr(std::move(error)));
  }

  // Runs func(args...) and captures either its value or whatever it threw.
  template <typename F, typename... Args>
  static Outcome Attempt(F&& func, Args&&... args) {
    try {
      return Success(std::invoke(std::forward<F>(func), std::forward<Args>(args)...));
    } catch (...) {
      return Failure(std::current_exception());
    }
  }

  bool IsSuccess() const noexcept {
    return state_.index() == 0;
  }

  bool IsFailure() const noexcept {
    return state_.index() == 1;
  }

  explicit operator bool() const noexcept {
    return IsSuccess();
  }

  // Value of a Success; rethrows the captured error of a Failure.
  const T& GetOrThrow() const& {
    if (IsFailure()) {
      std::rethrow_exception(std::get<1>(state_));
    }
    return std::get<0>(state_);
  }

  T GetOrThrow() && {
    if (IsFailure()) {
      std::rethrow_exception(std::get<1>(state_));
    }
    return std::move(std::get<0>(state_));
  }

  T ValueOr(T fallback) const {
    return IsSuccess() ? std::get<0>(state_) : std::move(fallback);
  }

  std::exception_ptr Error() const noexcept {
    return IsFailure() ? std::get<1>(state_) : nullptr;
  }

  std::string ErrorMessage() const {
    if (IsSuccess()) {
      return {};
    }
    try {
      std::rethrow_exception(std::get<1>(state_));
    } catch (const std::exception& e) {
      return e.what();
    } catch (...) {
      return "unknown error";
    }
  }

  // True if this is a Failure holding an exception of type E (or derived).
  template <typename E>
  bool FailedWith() const {
    if (IsSuccess()) {
      return false;
    }
    try {
      std::rethrow_exception(std::get<1>(state_));
    } catch (const E&) {
      return true;
    } catch (...) {
      return false;
    }
  }

  template <typename F>
  auto Map(F&& func) const -> Outcome<std::decay_t<std::invoke_result_t<F, const T&>>> {
    using U = std::decay_t<std::invoke_result_t<F, const T&>>;
    if (IsFailure()) {
      return Outcome<U>::Failure(std::get<1>(state_));
    }
    return Outcome<U>::Attempt(std::forward<F>(func), std::get<0>(state_));
  }

  // func(std::exception_ptr) -> T. A Success is returned unchanged.
  template <typename F>
  Outcome Recover(F&& func) const {
    if (IsSuccess()) {
      return *this;
    }
    return Attempt(std::forward<F>(func), std::get<1>(state_));
  }

  template <typename OnSuccess, typename OnFailure>
  decltype(auto) Match(OnSuccess&& on_success, OnFailure&& on_failure) const {
    if (IsSuccess()) {
      return std::invoke(std::forward<OnSuccess>(on_success), std::get<0>(state_));
    }
    return std::invoke(std::forward<OnFailure>(on_failure), std::get<1>(state_));
  }

 private:
  template <std::size_t I, typename V>
  Outcome(std::in_place_index_t<I> tag, V&& value) : state_(tag, std::forward<V>(value)) {
  }

  std::variant<T, std::exception_ptr> state_;
};

} // namespace hsm::util
