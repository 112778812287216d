/*
 * Copyright (c) 2026 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef GVCF_OVERLAY_GVCF_WRITER_HH
#define GVCF_OVERLAY_GVCF_WRITER_HH

#include <filesystem>
#include <gvcf_overlay/interval_map.hh>
#include <gvcf_overlay/variant_record.hh>
#include <ostream>
#include <string>


namespace gvcf_overlay {
	
	class gvcf_writer
	{
	protected:
		std::string		m_sample_name;
		std::ostream	*m_os{};
		
	public:
		gvcf_writer() = default;
		
		gvcf_writer(std::ostream &os, std::string sample_name):
			m_sample_name(std::move(sample_name)),
			m_os(&os)
		{
		}
		
		void output_vcf_header() const;
		void output_record(variant_record const &rec) const;
		
		// Header followed by every entry in position order.
		void output_map(interval_map const &map) const;
	};
	
	
	// “<sample_name>_mutated.g.vcf”
	std::string mutated_gvcf_file_name(std::string const &sample_name);
	
	// Creates output_dir if needed. Returns the path of the written file.
	std::filesystem::path write_mutated_gvcf(
		std::filesystem::path const &output_dir,
		std::string const &sample_name,
		interval_map const &map,
		bool const should_overwrite_files
	);
}

#endif
