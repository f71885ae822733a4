#ifndef RESULT_HPP
#define RESULT_HPP

#include <cassert>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>

enum class ErrorKind : std::uint8_t {
    InvalidCardFormat,
    UnknownEnumerationValue,
    SectionNotFound,
    MalformedHeader,
    MalformedStageLine,
    HeroNotFound,
    InvalidState,
    FileNotFound
};

std::string getErrorKindName(ErrorKind kind);

struct Error {
    ErrorKind kind;
    std::string message;
    std::string stage;
    std::optional<int> fragmentIndex;

    // "<kind> in stage <stage> at fragment <n>: <message>"
    std::string describe() const;
};

Error makeError(ErrorKind kind, const std::string& message);
Error makeError(ErrorKind kind, const std::string& message, int fragmentIndex);

template <typename T>
class Result {
public:
    Result(const T& value) : m_data{ value } {}
    Result(T&& value) : m_data{ std::move(value) } {}
    Result(const Error& error) : m_data{ error } {}
    Result(Error&& error) : m_data{ std::move(error) } {}

    bool isValue() const {
        return std::holds_alternative<T>(m_data);
    }

    bool isError() const {
        return std::holds_alternative<Error>(m_data);
    }

    const T& getValue() const {
        assert(isValue());
        return std::get<T>(m_data);
    }

    T& getValue() {
        assert(isValue());
        return std::get<T>(m_data);
    }

    const Error& getError() const {
        assert(isError());
        return std::get<Error>(m_data);
    }

private:
    std::variant<T, Error> m_data;
};

// Outcome of an operation that only mutates its arguments
template <>
class Result<void> {
public:
    Result() = default;
    Result(const Error& error) : m_error{ error } {}
    Result(Error&& error) : m_error{ std::move(error) } {}

    bool isValue() const {
        return !m_error.has_value();
    }

    bool isError() const {
        return m_error.has_value();
    }

    const Error& getError() const {
        assert(isError());
        return *m_error;
    }

private:
    std::optional<Error> m_error;
};

#endif // RESULT_HPP
