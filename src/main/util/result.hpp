#pragma once

#include <variant>
#include <optional>
#include <utility>
#include <type_traits>

namespace moordns {

/**
 * Either a value (Ok) or an error (Err).
 * Error and value types must differ, so that both converting constructors stay unambiguous.
 */
template<typename S, typename E> class result {
	static_assert(!std::is_same_v<S, E>, "result Ok and Err types must differ");
	std::variant<S, E> res;
	public:
		using OK = S;
		using ERR = E;
		result(const S& ok) : res(std::in_place_index<0>, ok) {}
		result(const E& err) : res(std::in_place_index<1>, err) {}
		result(S && ok) : res(std::in_place_index<0>, std::move(ok)) {}
		result(E && err) : res(std::in_place_index<1>, std::move(err)) {}
		bool isOk() const { return res.index() == 0; }
		bool isErr() const { return res.index() == 1; }
		const S* ok() const { return std::get_if<0>(&res); }
		const E* err() const { return std::get_if<1>(&res); }
		S* ok(){ return std::get_if<0>(&res); }
		E* err(){ return std::get_if<1>(&res); }
		explicit operator bool() const { return isOk(); }
	public:
		static result Ok(const S& ok){ return result(ok); }
		static result Err(const E& err){ return result(err); }
		static result Ok(S && ok){ return result(std::move(ok)); }
		static result Err(E && err){ return result(std::move(err)); }
};

template<typename E> class result<void, E> {
	std::optional<E> error;
	public:
		using OK = void;
		using ERR = E;
		result() : error() {}
		result(const E& e) : error(e) {}
		result(E && e) : error(std::move(e)) {}
		bool isOk() const { return !error.has_value(); }
		bool isErr() const { return error.has_value(); }
		const E* err() const { return error.has_value() ? error.operator->() : nullptr; }
		E* err(){ return error.has_value() ? error.operator->() : nullptr; }
		explicit operator bool() const { return isOk(); }
	public:
		static result Ok(){ return result(); }
		static result Err(const E& err){ return result(err); }
		static result Err(E && err){ return result(std::move(err)); }
};

}
