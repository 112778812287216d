/*
 * Copyright (c) 2026 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef GVCF_OVERLAY_INTERVAL_MAP_HH
#define GVCF_OVERLAY_INTERVAL_MAP_HH

#include <gvcf_overlay/genomic_position.hh>
#include <gvcf_overlay/variant_record.hh>
#include <map>
#include <range/v3/view/join.hpp>
#include <range/v3/view/map.hpp>
#include <string>


namespace gvcf_overlay {
	
	struct interval_entry
	{
		genomic_range	range;
		variant_record	record;
		
		interval_entry() = default;
		
		interval_entry(genomic_range range_, variant_record record_):
			range(std::move(range_)),
			record(std::move(record_))
		{
		}
	};
	
	
	// Maps disjoint closed ranges to variant records. The ranges of each contig
	// are stored by their start offset, the contigs in contig_name_less order.
	class interval_map
	{
	public:
		typedef std::map <std::size_t, interval_entry>						contig_entry_map;
		typedef std::map <std::string, contig_entry_map, contig_name_less>	entry_map;
		
	protected:
		entry_map	m_entries;
		std::size_t	m_size{};
		
	public:
		// Replaces the record of an identical range. Otherwise the range must not overlap any stored range.
		void put(genomic_range const &range, variant_record record);
		
		// No-op if the range is not stored as such.
		void remove(genomic_range const &range);
		
		variant_record const *get(genomic_position const &pos) const;
		interval_entry const *get_entry(genomic_position const &pos) const;
		
		// The first entry (in position order) that shares at least one position with range.
		interval_entry const *find_intersecting(genomic_range const &range) const;
		
		std::size_t size() const { return m_size; }
		bool empty() const { return 0 == m_size; }
		void clear() { m_entries.clear(); m_size = 0; }
		
		// All entries ordered by contig and start position.
		auto entries() const { return m_entries | ranges::view::values | ranges::view::join | ranges::view::values; }
		
	protected:
		contig_entry_map::const_iterator find_containing(contig_entry_map const &map, std::size_t const offset) const;
	};
}

#endif
