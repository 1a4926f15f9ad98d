// ============================================================================
// coalesce/core/result.hpp - Result Type for Error Handling
// ============================================================================
//
// Result<T, E> holds either a success value (T) or an error value (E). It is
// the terminal outcome of every transfer and the return type of the fallible
// dispatcher operations.
//
// USAGE:
// ------
//   Result<DownloadTask, Error> task = downloader.Download(key, {}, handler);
//   if (task.IsErr()) {
//       std::cerr << task.Error().message() << std::endl;
//       return;
//   }
//   task.Value().Cancel();
//
//   // Outcome delivered to completion handlers
//   void OnDone(const TransferOutcome& outcome) {
//       if (outcome.IsOk()) Decode(outcome.Value().data);
//   }
//
// ============================================================================

#pragma once

#include <type_traits>
#include <utility>
#include <variant>

namespace coalesce {

template <typename T, typename E>
class Result;

// ============================================================================
// Ok and Err Tag Types
// ============================================================================

template <typename T>
struct OkTag {
    T value;

    template <typename U>
    explicit OkTag(U&& v) : value(std::forward<U>(v)) {}
};

template <typename E>
struct ErrTag {
    E error;

    template <typename U>
    explicit ErrTag(U&& e) : error(std::forward<U>(e)) {}
};

template <typename T>
OkTag<std::decay_t<T>> Ok(T&& value) {
    return OkTag<std::decay_t<T>>(std::forward<T>(value));
}

template <typename E>
ErrTag<std::decay_t<E>> Err(E&& error) {
    return ErrTag<std::decay_t<E>>(std::forward<E>(error));
}

// ============================================================================
// Result<T, E> - Success or Error
// ============================================================================
template <typename T, typename E>
class Result {
   public:
    template <typename U>
    Result(OkTag<U>&& ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    template <typename U>
    Result(ErrTag<U>&& err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool IsOk() const noexcept { return data_.index() == 0; }
    bool IsErr() const noexcept { return data_.index() == 1; }

    explicit operator bool() const noexcept { return IsOk(); }

    // Undefined behavior if IsErr()
    T& Value() & { return std::get<0>(data_); }
    const T& Value() const& { return std::get<0>(data_); }
    T&& Value() && { return std::get<0>(std::move(data_)); }

    // Undefined behavior if IsOk()
    E& Error() & { return std::get<1>(data_); }
    const E& Error() const& { return std::get<1>(data_); }
    E&& Error() && { return std::get<1>(std::move(data_)); }

    // Map: Transform success value. Used to turn a job's response into the
    // payload handed to callers.
    template <typename F>
    auto Map(F&& func) && -> Result<std::invoke_result_t<F, T&&>, E> {
        if (IsOk()) {
            return Ok(func(std::move(*this).Value()));
        }
        return Err(std::move(*this).Error());
    }

    // AndThen: Chain operations that return Result, e.g. response validation
    template <typename F>
    auto AndThen(F&& func) && -> std::invoke_result_t<F, T&&> {
        if (IsOk()) {
            return func(std::move(*this).Value());
        }
        return Err(std::move(*this).Error());
    }

   private:
    std::variant<T, E> data_;
};

}  // namespace coalesce
