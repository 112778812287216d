/*
 * Copyright (c) 2026 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef GVCF_OVERLAY_VARIANT_SOURCE_HH
#define GVCF_OVERLAY_VARIANT_SOURCE_HH

#include <gvcf_overlay/variant_record.hh>
#include <stdexcept>
#include <string>
#include <vector>


namespace gvcf_overlay {
	
	// Thrown when an input does not fit the expected layout, e.g. it does not name exactly one sample.
	class configuration_error : public std::runtime_error
	{
	public:
		using std::runtime_error::runtime_error;
	};
	
	
	struct variant_source
	{
		virtual ~variant_source() {}
		
		// In the order of the header.
		virtual std::vector <std::string> const &sample_names() const = 0;
		
		// Returns false at end of input.
		virtual bool next_variant(variant_record &out_rec) = 0;
	};
	
	
	class vector_variant_source final : public variant_source
	{
	protected:
		std::vector <std::string>		m_sample_names;
		std::vector <variant_record>	m_records;
		std::size_t						m_idx{};
		
	public:
		vector_variant_source() = default;
		
		vector_variant_source(std::vector <std::string> sample_names, std::vector <variant_record> records):
			m_sample_names(std::move(sample_names)),
			m_records(std::move(records))
		{
		}
		
		std::vector <std::string> const &sample_names() const override { return m_sample_names; }
		
		bool next_variant(variant_record &out_rec) override
		{
			if (m_records.size() <= m_idx)
				return false;
			
			out_rec = m_records[m_idx++];
			return true;
		}
	};
}

#endif
