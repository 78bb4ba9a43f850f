#include<Ev/Io.hpp>
#include<Ev/start.hpp>
#include<Rebal/Main.hpp>
#include<curl/curl.h>
#include<iostream>
#include<memory>

namespace {

Ev::Io<int> io_main(int argc, char **argv) {
	auto arg_vec = std::vector<std::string>();
	for (int i = 0; i < argc; ++i) {
		arg_vec.push_back(std::string(argv[i]));
	}
	auto main_obj = std::make_shared<Rebal::Main>(
		arg_vec, std::cout, std::cerr
	);
	return main_obj->run().then([main_obj](int ec) {
		/* Ensures main_obj is alive!  */
		return Ev::lift(ec);
	});
}

}

int main (int argc, char **argv) {
	/* libcurl wants this before any thread uses it.  */
	if (curl_global_init(CURL_GLOBAL_ALL) != 0) {
		std::cerr << argv[0] << ": curl_global_init failed"
			  << std::endl;
		return 1;
	}
	auto code = io_main(argc, argv);
	auto ec = Ev::start(code);
	curl_global_cleanup();
	return ec;
}
