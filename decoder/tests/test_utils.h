#pragma once

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

namespace WASMDecoder::Tests {

	inline void check(bool cond, const std::string& msg) {
		if (!cond) {
			std::cerr << "FAIL: " << msg << '\n';
			std::exit(1);
		}
	}

	// Runs the function and returns the error of the expected type it throws
	template<typename TError, typename TFunc>
	TError expectThrow(TFunc func, const std::string& msg) {
		try {
			func();
		}
		catch (const TError& e) {
			return e;
		}
		catch (const std::exception& e) {
			std::cerr << "FAIL: " << msg << " (unexpected exception: " << e.what() << ")\n";
			std::exit(1);
		}

		std::cerr << "FAIL: " << msg << " (no exception thrown)\n";
		std::exit(1);
	}
}
