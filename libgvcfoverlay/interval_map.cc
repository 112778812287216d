/*
 * Copyright (c) 2026 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <gvcf_overlay/interval_map.hh>
#include <iterator>
#include <libbio/assert.hh>


namespace gvcf_overlay {
	
	auto interval_map::find_containing(contig_entry_map const &map, std::size_t const offset) const -> contig_entry_map::const_iterator
	{
		// Find the last range that starts at or before offset.
		auto it(map.upper_bound(offset));
		if (map.begin() == it)
			return map.end();
		
		--it;
		if (offset <= it->second.range.end)
			return it;
		
		return map.end();
	}
	
	
	void interval_map::put(genomic_range const &range, variant_record record)
	{
		libbio_always_assert_lte(range.start, range.end);
		auto &contig_map(m_entries[range.contig]);
		
		auto const it(contig_map.find(range.start));
		if (contig_map.end() != it)
		{
			libbio_always_assert_eq_msg(it->second.range.end, range.end, "Range ", range, " overlaps ", it->second.range);
			it->second.record = std::move(record);
			return;
		}
		
#ifndef NDEBUG
		{
			// Check that the neighbours do not overlap.
			auto const next_it(contig_map.upper_bound(range.start));
			if (contig_map.end() != next_it)
				libbio_assert_msg(range.end < next_it->second.range.start, "Range ", range, " overlaps ", next_it->second.range);
			if (contig_map.begin() != next_it)
			{
				auto const prev_it(std::prev(next_it));
				libbio_assert_msg(prev_it->second.range.end < range.start, "Range ", range, " overlaps ", prev_it->second.range);
			}
		}
#endif
		
		contig_map.emplace_hint(it, range.start, interval_entry(range, std::move(record)));
		++m_size;
	}
	
	
	void interval_map::remove(genomic_range const &range)
	{
		auto const contig_it(m_entries.find(range.contig));
		if (m_entries.end() == contig_it)
			return;
		
		auto &contig_map(contig_it->second);
		auto const it(contig_map.find(range.start));
		if (contig_map.end() == it || it->second.range.end != range.end)
			return;
		
		contig_map.erase(it);
		--m_size;
		
		if (contig_map.empty())
			m_entries.erase(contig_it);
	}
	
	
	interval_entry const *interval_map::get_entry(genomic_position const &pos) const
	{
		auto const contig_it(m_entries.find(pos.contig));
		if (m_entries.end() == contig_it)
			return nullptr;
		
		auto const &contig_map(contig_it->second);
		auto const it(find_containing(contig_map, pos.offset));
		if (contig_map.end() == it)
			return nullptr;
		
		return &it->second;
	}
	
	
	variant_record const *interval_map::get(genomic_position const &pos) const
	{
		auto const *entry(get_entry(pos));
		if (!entry)
			return nullptr;
		
		return &entry->record;
	}
	
	
	interval_entry const *interval_map::find_intersecting(genomic_range const &range) const
	{
		auto const contig_it(m_entries.find(range.contig));
		if (m_entries.end() == contig_it)
			return nullptr;
		
		auto const &contig_map(contig_it->second);
		
		{
			auto const it(find_containing(contig_map, range.start));
			if (contig_map.end() != it)
				return &it->second;
		}
		
		// Otherwise the first range that starts inside the given one.
		auto const it(contig_map.lower_bound(range.start));
		if (contig_map.end() != it && it->second.range.start <= range.end)
			return &it->second;
		
		return nullptr;
	}
}
