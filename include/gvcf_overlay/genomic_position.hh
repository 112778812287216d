/*
 * Copyright (c) 2026 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef GVCF_OVERLAY_GENOMIC_POSITION_HH
#define GVCF_OVERLAY_GENOMIC_POSITION_HH

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>


namespace gvcf_overlay {
	
	// Negative, zero or positive like std::string::compare.
	// Contig names that parse as integers after removing “chr” (in any case) and
	// surrounding whitespace come first in numeric order, the rest follow in
	// lexicographic order. Names with equal numeric values are ordered lexicographically.
	int compare_contig_names(std::string_view const lhs, std::string_view const rhs);
	
	
	struct contig_name_less
	{
		typedef void is_transparent;
		
		bool operator()(std::string_view const lhs, std::string_view const rhs) const { return compare_contig_names(lhs, rhs) < 0; }
	};
	
	
	struct genomic_position
	{
		std::string	contig;
		std::size_t	offset{};		// 1-based.
		
		genomic_position() = default;
		
		genomic_position(std::string contig_, std::size_t const offset_):
			contig(std::move(contig_)),
			offset(offset_)
		{
		}
		
		bool operator==(genomic_position const &other) const = default;
	};
	
	
	// Closed range on one contig.
	struct genomic_range
	{
		std::string	contig;
		std::size_t	start{};
		std::size_t	end{};
		
		genomic_range() = default;
		
		genomic_range(std::string contig_, std::size_t const start_, std::size_t const end_):
			contig(std::move(contig_)),
			start(start_),
			end(end_)
		{
		}
		
		std::size_t length() const { return end - start + 1; }
		
		inline bool contains(genomic_position const &pos) const;
		inline bool intersects(genomic_range const &other) const;
		
		bool operator==(genomic_range const &other) const = default;
	};
	
	
	inline bool operator<(genomic_position const &lhs, genomic_position const &rhs)
	{
		if (lhs.contig == rhs.contig)
			return lhs.offset < rhs.offset;
		
		return compare_contig_names(lhs.contig, rhs.contig) < 0;
	}
	
	
	bool genomic_range::contains(genomic_position const &pos) const
	{
		return contig == pos.contig && start <= pos.offset && pos.offset <= end;
	}
	
	
	bool genomic_range::intersects(genomic_range const &other) const
	{
		return contig == other.contig && start <= other.end && other.start <= end;
	}
	
	
	inline std::ostream &operator<<(std::ostream &os, genomic_position const &pos)
	{
		os << pos.contig << ':' << pos.offset;
		return os;
	}
	
	
	inline std::ostream &operator<<(std::ostream &os, genomic_range const &range)
	{
		os << range.contig << ':' << range.start << '-' << range.end;
		return os;
	}
}

#endif
