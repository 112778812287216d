/*
 * Copyright (c) 2026 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <gvcf_overlay/overlay_logger.hh>
#include <libbio/assert.hh>


namespace lb	= libbio;


namespace gvcf_overlay {
	
	void overlay_logger::open_log_file(char const *output_path, bool const should_overwrite_files)
	{
		auto const mode(lb::make_writing_open_mode({
			lb::writing_open_mode::CREATE,
			(should_overwrite_files ? lb::writing_open_mode::OVERWRITE : lb::writing_open_mode::NONE)
		}));
		lb::open_file_for_writing(output_path, m_log_output_stream, mode);
		m_os = &m_log_output_stream;
		write_header();
	}
	
	
	void overlay_logger::write_header()
	{
		*m_os << "LINENO\tCHROM\tPOS\tREASON\tEXTRA\n";
	}
	
	
	void overlay_logger::overlay_engine_skipped_variant(
		variant_record const &incoming,
		variant_record const *existing,
		donor_outcome const outcome
	)
	{
		if (!m_os)
			return;
		
		switch (outcome)
		{
			case donor_outcome::MISSING_ALT_SKIPPED:
				log_wt(incoming, outcome, '.');
				break;
				
			case donor_outcome::INDEL_OVERLAP_SKIPPED:
				libbio_assert(existing);
				log_wt(incoming, outcome, existing->range());
				break;
				
			case donor_outcome::UNHANDLED_OVERLAP:
				// The overlapping record, if any.
				if (existing)
					log_wt(incoming, outcome, existing->range());
				else
					log_wt(incoming, outcome, '.');
				break;
				
			case donor_outcome::INSERTED:
			case donor_outcome::IDENTICAL:
			case donor_outcome::REPLACED:
			case donor_outcome::SPLIT:
			case donor_outcome::REFERENCE_BLOCK_SKIPPED:
				break;
		}
	}
	
	
	template <typename t_extra>
	void overlay_logger::log_wt(variant_record const &rec, donor_outcome const reason, t_extra const &extra)
	{
		*m_os << rec.lineno() << '\t' << rec.contig() << '\t' << rec.start() << '\t' << reason << '\t' << extra << '\n';
	}
}
