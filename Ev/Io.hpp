#ifndef EV_IO_HPP
#define EV_IO_HPP

#include<exception>
#include<functional>
#include<memory>
#include<type_traits>
#include<utility>

namespace Ev {

/* Pre-declare for Detail::IoInner.  */
template<typename a>
class Io;

namespace Detail {

/* Given an Io<a>, extract the type a.  */
template<typename t>
struct IoInner;
template<typename a>
struct IoInner<Io<a>> {
	using type = a;
};

/* Result of a `then` continuation.  */
template<typename a, typename f>
struct ThenResult {
	using type = typename IoInner<
		typename std::decay<
			decltype(std::declval<f>()(std::declval<a>()))
		>::type
	>::type;
};
template<typename f>
struct ThenResult<void, f> {
	using type = typename IoInner<
		typename std::decay<
			decltype(std::declval<f>()())
		>::type
	>::type;
};

}

/** class Ev::Io<a>
 *
 * @brief an action that, when run, eventually
 * either passes a value of type `a` or fails
 * with an exception.
 *
 * @desc This is a continuation monad.
 * Actions are constructed from a core function
 * that accepts a `pass` and a `fail` callback.
 */
template<typename a>
class Io {
public:
	typedef std::function<void(a)> PassFunc;
	typedef std::function<void(std::exception_ptr)> FailFunc;
	typedef std::function<void (PassFunc, FailFunc)> CoreFunc;

private:
	CoreFunc core;

	template<typename b>
	friend class Io;

public:
	explicit
	Io(CoreFunc core_) : core(std::move(core_)) { }

	/* (>>=) :: IO a -> (a -> IO b) -> IO b */
	template<typename f>
	Io<typename Detail::ThenResult<a, f>::type>
	then(f func) const {
		using b = typename Detail::ThenResult<a, f>::type;
		auto core_copy = core;
		return Io<b>([ core_copy
			     , func
			     ]( typename Io<b>::PassFunc pass
			      , FailFunc fail
			      ) {
			try {
				auto sub_pass = [func, pass, fail](a value) {
					try {
						func(std::move(value)).core(pass, fail);
					} catch (...) {
						fail(std::current_exception());
					}
				};
				core_copy(sub_pass, fail);
			} catch (...) {
				fail(std::current_exception());
			}
		});
	}

	/* Handles exceptions of type `e` thrown within this action.  */
	template<typename e>
	Io<a> catching(std::function<Io<a>(e const&)> handler) const {
		auto core_copy = core;
		return Io<a>([ core_copy
			     , handler
			     ](PassFunc pass, FailFunc fail) {
			auto sub_fail = [pass, fail, handler](std::exception_ptr err) {
				try {
					std::rethrow_exception(err);
				} catch (e const& ex) {
					try {
						handler(ex).core(pass, fail);
					} catch (...) {
						fail(std::current_exception());
					}
				} catch (...) {
					fail(std::current_exception());
				}
			};
			try {
				core_copy(pass, sub_fail);
			} catch (...) {
				sub_fail(std::current_exception());
			}
		});
	}

	/* Executes the action.
	 * Exactly one of pass or fail is called, at most once.
	 */
	void run(PassFunc pass, FailFunc fail) const noexcept {
		auto completed = std::make_shared<bool>(false);
		auto sub_pass = [completed, pass](a value) {
			if (!*completed) {
				*completed = true;
				pass(std::move(value));
			}
		};
		auto sub_fail = [completed, fail](std::exception_ptr e) {
			if (!*completed) {
				*completed = true;
				fail(std::move(e));
			}
		};
		try {
			core(std::move(sub_pass), sub_fail);
		} catch (...) {
			sub_fail(std::current_exception());
		}
	}
};

template<>
class Io<void> {
public:
	typedef std::function<void()> PassFunc;
	typedef std::function<void(std::exception_ptr)> FailFunc;
	typedef std::function<void (PassFunc, FailFunc)> CoreFunc;

private:
	CoreFunc core;

	template<typename b>
	friend class Io;

public:
	explicit
	Io(CoreFunc core_) : core(std::move(core_)) { }

	/* (>>=) :: IO () -> (() -> IO b) -> IO b */
	template<typename f>
	Io<typename Detail::ThenResult<void, f>::type>
	then(f func) const {
		using b = typename Detail::ThenResult<void, f>::type;
		auto core_copy = core;
		return Io<b>([ core_copy
			     , func
			     ]( typename Io<b>::PassFunc pass
			      , FailFunc fail
			      ) {
			try {
				auto sub_pass = [func, pass, fail]() {
					try {
						func().core(pass, fail);
					} catch (...) {
						fail(std::current_exception());
					}
				};
				core_copy(sub_pass, fail);
			} catch (...) {
				fail(std::current_exception());
			}
		});
	}

	template<typename e>
	Io<void> catching(std::function<Io<void>(e const&)> handler) const {
		auto core_copy = core;
		return Io<void>([ core_copy
				, handler
				](PassFunc pass, FailFunc fail) {
			auto sub_fail = [pass, fail, handler](std::exception_ptr err) {
				try {
					std::rethrow_exception(err);
				} catch (e const& ex) {
					try {
						handler(ex).core(pass, fail);
					} catch (...) {
						fail(std::current_exception());
					}
				} catch (...) {
					fail(std::current_exception());
				}
			};
			try {
				core_copy(pass, sub_fail);
			} catch (...) {
				sub_fail(std::current_exception());
			}
		});
	}

	void run(PassFunc pass, FailFunc fail) const noexcept {
		auto completed = std::make_shared<bool>(false);
		auto sub_pass = [completed, pass]() {
			if (!*completed) {
				*completed = true;
				pass();
			}
		};
		auto sub_fail = [completed, fail](std::exception_ptr e) {
			if (!*completed) {
				*completed = true;
				fail(std::move(e));
			}
		};
		try {
			core(std::move(sub_pass), sub_fail);
		} catch (...) {
			sub_fail(std::current_exception());
		}
	}
};

template<typename a>
Io<a> lift(a val) {
	auto container = std::make_shared<a>(std::move(val));
	return Io<a>([container]( std::function<void(a)> pass
				, std::function<void(std::exception_ptr)> fail
				) {
		pass(std::move(*container));
	});
}
inline
Io<void> lift() {
	return Io<void>([]( std::function<void()> pass
			  , std::function<void(std::exception_ptr)> fail
			  ) {
		pass();
	});
}

/* Sequence two actions, ignoring results.  */
inline
Io<void> operator+(Io<void> a, Io<void> b) {
	return a.then([b]() { return b; });
}

}

#endif /* !defined(EV_IO_HPP) */
