/*
 * Copyright (c) 2026 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef GVCF_OVERLAY_VARIANT_RECORD_HH
#define GVCF_OVERLAY_VARIANT_RECORD_HH

#include <cstdint>
#include <gvcf_overlay/genomic_position.hh>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>


namespace gvcf_overlay {
	
	constexpr inline std::string_view NON_REF_ALT{"<NON_REF>"};
	
	
	enum class record_kind : std::uint8_t
	{
		REFERENCE_BLOCK = 0,	// Single-character REF, ALT is <NON_REF>.
		SNV,					// Single-character REF, ALT at most one character.
		INDEL					// REF or ALT longer than one character, including multi-allelic sites.
	};
	
	
	record_kind classify_alleles(std::string_view const ref, std::string_view const alt);
	
	
	// Values of the ASM_* INFO fields, copied from the input as-is.
	struct assembly_annotation
	{
		std::optional <std::string>		chr;
		std::optional <std::int32_t>	start;
		std::optional <std::int32_t>	end;
		std::optional <std::string>		strand;
		
		bool empty() const { return !(chr || start || end || strand); }
		bool operator==(assembly_annotation const &other) const = default;
	};
	
	
	class variant_record
	{
	protected:
		std::string			m_contig;
		std::string			m_ref;
		std::string			m_alt;			// Comma-separated if there are multiple ALTs.
		assembly_annotation	m_assembly;
		std::size_t			m_start{};		// 1-based, closed.
		std::size_t			m_end{};
		std::size_t			m_lineno{};		// Zero for records not read from a file.
		record_kind			m_kind{};
		bool				m_is_donor_origin{};
		
	public:
		variant_record() = default;
		
		variant_record(
			std::string contig,
			std::size_t const start,
			std::size_t const end,
			std::string ref,
			std::string alt,
			bool const is_donor_origin = false
		);
		
		std::string const &contig() const { return m_contig; }
		std::size_t start() const { return m_start; }
		std::size_t end() const { return m_end; }
		genomic_position start_position() const { return {m_contig, m_start}; }
		genomic_range range() const { return {m_contig, m_start, m_end}; }
		std::string const &ref() const { return m_ref; }
		std::string const &alt() const { return m_alt; }
		record_kind kind() const { return m_kind; }
		bool is_donor_origin() const { return m_is_donor_origin; }
		std::size_t lineno() const { return m_lineno; }
		assembly_annotation const &assembly() const { return m_assembly; }
		
		bool is_reference_block() const { return record_kind::REFERENCE_BLOCK == m_kind; }
		bool is_indel() const { return record_kind::INDEL == m_kind; }
		bool is_single_position() const { return m_start == m_end; }
		
		// Copies with one property changed.
		variant_record with_donor_origin(bool const is_donor_origin) const;
		variant_record with_lineno(std::size_t const lineno) const;
		variant_record with_assembly(assembly_annotation assembly) const;
		
		// Compares the location and the alleles; the origin and the annotations are ignored.
		bool operator==(variant_record const &other) const;
	};
	
	
	// A reference block with the given range and reference character.
	variant_record make_reference_block(std::string contig, std::size_t const start, std::size_t const end, std::string ref);
	
	
	std::ostream &operator<<(std::ostream &os, record_kind const kind);
	std::ostream &operator<<(std::ostream &os, variant_record const &rec);
}

#endif
