#ifndef REBAL_MAIN_HPP
#define REBAL_MAIN_HPP

#include<memory>
#include<ostream>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }

namespace Rebal {

class Main {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Main() = delete;
	Main( std::vector<std::string> argv
	    , std::ostream& cout
	    , std::ostream& cerr
	    );
	Main(Main&&);
	~Main();

	Ev::Io<int> run();
};

}

#endif /* !defined(REBAL_MAIN_HPP) */
