#ifndef RESULT_HPP
#define RESULT_HPP

#include <cassert>
#include <concepts>
#include <string>
#include <utility>
#include <variant>

template <typename T, typename E = std::string>
class Result {
public:
    Result(const T& value) : m_data{ std::in_place_index<0>, value } {}
    Result(T&& value) : m_data{ std::in_place_index<0>, std::move(value) } {}
    Result(const E& error) : m_data{ std::in_place_index<1>, error } {}
    Result(E&& error) : m_data{ std::in_place_index<1>, std::move(error) } {}
    Result(const char* error) requires std::same_as<E, std::string> : m_data{ std::in_place_index<1>, std::string{ error } } {}

    bool isValue() const {
        return m_data.index() == 0;
    }

    bool isError() const {
        return m_data.index() == 1;
    }

    const T& getValue() const {
        assert(isValue());
        return std::get<0>(m_data);
    }

    T& getValue() {
        assert(isValue());
        return std::get<0>(m_data);
    }

    const E& getError() const {
        assert(isError());
        return std::get<1>(m_data);
    }

private:
    std::variant<T, E> m_data;
};

#endif // RESULT_HPP
