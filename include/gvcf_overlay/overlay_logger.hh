/*
 * Copyright (c) 2026 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef GVCF_OVERLAY_OVERLAY_LOGGER_HH
#define GVCF_OVERLAY_OVERLAY_LOGGER_HH

#include <gvcf_overlay/overlay_engine.hh>
#include <libbio/file_handling.hh>
#include <ostream>


namespace gvcf_overlay {
	
	// Writes the skipped donor records as TSV if a log file has been opened.
	class overlay_logger final : public overlay_delegate
	{
	protected:
		libbio::file_ostream	m_log_output_stream;
		std::ostream			*m_os{};
		
	public:
		overlay_logger() = default;
		
		// For logging to a stream owned by the caller.
		explicit overlay_logger(std::ostream &os):
			m_os(&os)
		{
			write_header();
		}
		
		void open_log_file(char const *path, bool const should_overwrite_files);
		void flush() { if (m_os) m_os->flush(); }
		
		void overlay_engine_skipped_variant(
			variant_record const &incoming,
			variant_record const *existing,
			donor_outcome const outcome
		) override;
		
	protected:
		void write_header();
		
		template <typename t_extra>
		void log_wt(variant_record const &rec, donor_outcome const reason, t_extra const &extra);
	};
}

#endif
