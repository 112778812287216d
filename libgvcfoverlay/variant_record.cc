/*
 * Copyright (c) 2026 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <gvcf_overlay/variant_record.hh>
#include <libbio/assert.hh>
#include <utility>


namespace gvcf_overlay {
	
	record_kind classify_alleles(std::string_view const ref, std::string_view const alt)
	{
		if (1 == ref.size() && NON_REF_ALT == alt)
			return record_kind::REFERENCE_BLOCK;
		
		if (1 < ref.size() || 1 < alt.size())
			return record_kind::INDEL;
		
		// Also with a missing ALT.
		return record_kind::SNV;
	}
	
	
	variant_record::variant_record(
		std::string contig,
		std::size_t const start,
		std::size_t const end,
		std::string ref,
		std::string alt,
		bool const is_donor_origin
	):
		m_contig(std::move(contig)),
		m_ref(std::move(ref)),
		m_alt(std::move(alt)),
		m_start(start),
		m_end(end),
		m_kind(classify_alleles(m_ref, m_alt)),
		m_is_donor_origin(is_donor_origin)
	{
		libbio_always_assert_msg(0 < m_start, "Positions are 1-based");
		libbio_always_assert_msg(m_start <= m_end, "Record end precedes its start at ", m_contig, ':', m_start);
	}
	
	
	variant_record variant_record::with_donor_origin(bool const is_donor_origin) const
	{
		auto retval(*this);
		retval.m_is_donor_origin = is_donor_origin;
		return retval;
	}
	
	
	variant_record variant_record::with_lineno(std::size_t const lineno) const
	{
		auto retval(*this);
		retval.m_lineno = lineno;
		return retval;
	}
	
	
	variant_record variant_record::with_assembly(assembly_annotation assembly) const
	{
		auto retval(*this);
		retval.m_assembly = std::move(assembly);
		return retval;
	}
	
	
	bool variant_record::operator==(variant_record const &other) const
	{
		return (
			m_start == other.m_start &&
			m_end == other.m_end &&
			m_contig == other.m_contig &&
			m_ref == other.m_ref &&
			m_alt == other.m_alt
		);
	}
	
	
	variant_record make_reference_block(std::string contig, std::size_t const start, std::size_t const end, std::string ref)
	{
		return variant_record(std::move(contig), start, end, std::move(ref), std::string(NON_REF_ALT), false);
	}
	
	
	std::ostream &operator<<(std::ostream &os, record_kind const kind)
	{
		switch (kind)
		{
			case record_kind::REFERENCE_BLOCK:
				os << "REFERENCE_BLOCK";
				return os;
				
			case record_kind::SNV:
				os << "SNV";
				return os;
				
			case record_kind::INDEL:
				os << "INDEL";
				return os;
		}
		
		return os;
	}
	
	
	std::ostream &operator<<(std::ostream &os, variant_record const &rec)
	{
		os << rec.range() << " ref: " << rec.ref() << " alt: " << rec.alt() << " kind: " << rec.kind();
		if (rec.is_donor_origin())
			os << " (donor)";
		return os;
	}
}
