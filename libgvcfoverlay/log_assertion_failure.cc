/*
 * Copyright (c) 2026 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <boost/exception/get_error_info.hpp>
#include <boost/stacktrace.hpp>
#include <gvcf_overlay/utility/log_assertion_failure.hh>

namespace lb	= libbio;


namespace {
	
	void log_stack_trace(std::ostream &os, std::exception const &exc)
	{
		auto const *st(boost::get_error_info <lb::traced>(exc));
		if (st)
			os << "Stack trace:\n" << *st << '\n';
	}
}


namespace gvcf_overlay {
	
	void log_assertion_failure_exception(std::ostream &os, lb::assertion_failure_exception const &exc)
	{
		os << "ERROR: Assertion failure: " << exc.what() << '\n';
		log_stack_trace(os, exc);
	}
	
	
	void log_exception(std::ostream &os, std::exception const &exc)
	{
		os << "ERROR: Caught an exception: " << exc.what() << '\n';
		log_stack_trace(os, exc);
	}
}
