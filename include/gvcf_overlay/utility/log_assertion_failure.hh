/*
 * Copyright (c) 2026 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef GVCF_OVERLAY_UTILITY_LOG_ASSERTION_FAILURE_HH
#define GVCF_OVERLAY_UTILITY_LOG_ASSERTION_FAILURE_HH

#include <libbio/assert.hh>
#include <ostream>


namespace gvcf_overlay {
	void log_assertion_failure_exception(std::ostream &os, libbio::assertion_failure_exception const &exc);
	void log_exception(std::ostream &os, std::exception const &exc);
}

#endif
