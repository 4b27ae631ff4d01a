#ifndef DESKPROBE_RESULT_H
#define DESKPROBE_RESULT_H

#include "core/Error.h"

#include <optional>
#include <type_traits>
#include <utility>

namespace DeskProbe {

/**
 * @brief Either a value of type T or an Error.
 *
 * A default-constructed Result holds neither a value nor a meaningful
 * error; it exists so results can travel through QFuture and std::promise.
 */
template <typename T>
class Result
{
public:
    Result() = default;

    static Result success(T value)
    {
        Result result;
        result.m_value.emplace(std::move(value));
        return result;
    }

    static Result failure(Error error)
    {
        Result result;
        result.m_error = std::move(error);
        return result;
    }

    bool isSuccess() const { return m_value.has_value(); }

    const T &value() const & { return *m_value; }
    T &value() & { return *m_value; }
    T takeValue() { return std::move(*m_value); }

    T valueOr(T fallback) const { return m_value ? *m_value : std::move(fallback); }

    const Error &error() const { return m_error; }

    // Transforms the value, forwarding the error untouched.
    template <typename F>
    auto map(F &&transform) const -> Result<std::decay_t<decltype(transform(std::declval<const T &>()))>>
    {
        using U = std::decay_t<decltype(transform(std::declval<const T &>()))>;
        if (!m_value) {
            return Result<U>::failure(m_error);
        }
        return Result<U>::success(transform(*m_value));
    }

private:
    std::optional<T> m_value;
    Error m_error;
};

// Reply payload for commands that carry no data.
struct Acknowledgement
{
};

} // namespace DeskProbe

#endif // DESKPROBE_RESULT_H
