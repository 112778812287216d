/*
 * Copyright (c) 2026 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <cctype>
#include <charconv>
#include <cstdint>
#include <gvcf_overlay/genomic_position.hh>
#include <optional>


namespace {
	
	inline bool is_chr_prefix_at(std::string_view const &sv, std::size_t const idx)
	{
		if (sv.size() < idx + 3)
			return false;
		
		return (
			'c' == std::tolower(static_cast <unsigned char>(sv[idx])) &&
			'h' == std::tolower(static_cast <unsigned char>(sv[idx + 1])) &&
			'r' == std::tolower(static_cast <unsigned char>(sv[idx + 2]))
		);
	}
	
	
	std::optional <std::int64_t> contig_number(std::string_view const name)
	{
		// Remove every occurrence of “chr”, then the surrounding whitespace.
		std::string stripped;
		stripped.reserve(name.size());
		for (std::size_t i(0); i < name.size(); ++i)
		{
			if (is_chr_prefix_at(name, i))
			{
				i += 2;
				continue;
			}
			
			stripped.push_back(name[i]);
		}
		
		std::string_view sv(stripped);
		while (!sv.empty() && std::isspace(static_cast <unsigned char>(sv.front())))
			sv.remove_prefix(1);
		while (!sv.empty() && std::isspace(static_cast <unsigned char>(sv.back())))
			sv.remove_suffix(1);
		
		if (sv.empty())
			return std::nullopt;
		
		std::int64_t retval{};
		auto const *end(sv.data() + sv.size());
		auto const res(std::from_chars(sv.data(), end, retval));
		if (std::errc() != res.ec || end != res.ptr)
			return std::nullopt;
		
		return retval;
	}
}


namespace gvcf_overlay {
	
	int compare_contig_names(std::string_view const lhs, std::string_view const rhs)
	{
		if (lhs == rhs)
			return 0;
		
		auto const lhs_num(contig_number(lhs));
		auto const rhs_num(contig_number(rhs));
		
		if (lhs_num && rhs_num)
		{
			if (*lhs_num < *rhs_num)
				return -1;
			if (*rhs_num < *lhs_num)
				return 1;
			return lhs.compare(rhs);
		}
		
		// Numbered contigs precede the rest.
		if (lhs_num)
			return -1;
		if (rhs_num)
			return 1;
		
		return lhs.compare(rhs);
	}
}
