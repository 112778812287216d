/*
 * Copyright (c) 2026 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef GVCF_OVERLAY_OVERLAY_ENGINE_HH
#define GVCF_OVERLAY_OVERLAY_ENGINE_HH

#include <cstdint>
#include <gvcf_overlay/interval_map.hh>
#include <gvcf_overlay/variant_record.hh>
#include <gvcf_overlay/variant_source.hh>
#include <ostream>
#include <string>
#include <vector>


namespace gvcf_overlay {
	
	// What happened to one donor record.
	enum class donor_outcome : std::uint8_t
	{
		INSERTED = 0,				// Added to previously uncovered space.
		IDENTICAL,					// Already present.
		REPLACED,					// Superseded a single-position record.
		SPLIT,						// Placed inside a reference block.
		REFERENCE_BLOCK_SKIPPED,
		MISSING_ALT_SKIPPED,
		INDEL_OVERLAP_SKIPPED,		// Both the donor and the base record are indels.
		UNHANDLED_OVERLAP			// Any other combination; the map is not changed.
	};
	
	
	struct overlay_statistics
	{
		std::size_t	base_records{};
		std::size_t	donor_records{};
		std::size_t	inserted_variants{};
		std::size_t	identical_variants{};
		std::size_t	replaced_variants{};
		std::size_t	split_reference_blocks{};
		std::size_t	reference_blocks_skipped{};
		std::size_t	missing_alt_skipped{};
		std::size_t	indel_overlaps_skipped{};
		std::size_t	unhandled_overlaps{};
		
		void count(donor_outcome const outcome);
	};
	
	
	struct overlay_delegate
	{
		virtual ~overlay_delegate() {}
		
		// Called for the donor records that were left out for a reason other than being reference blocks.
		// existing is nullptr if the donor record did not overlap a stored record.
		virtual void overlay_engine_skipped_variant(
			variant_record const &incoming,
			variant_record const *existing,
			donor_outcome const outcome
		) = 0;
	};
	
	
	// Splits a reference block into the part before incoming, incoming and the part after it.
	// incoming has to be contained in the block.
	std::vector <variant_record> split_reference_block(variant_record const &block, variant_record const &incoming);
	
	
	class overlay_engine
	{
	protected:
		interval_map		m_map;
		overlay_statistics	m_statistics;
		overlay_delegate	*m_delegate{};
		
	public:
		overlay_engine() = default;
		
		explicit overlay_engine(overlay_delegate *delegate):
			m_delegate(delegate)
		{
		}
		
		// Replaces the current map with the records of base. Returns the sample name.
		std::string build(variant_source &base);
		
		// Adds the donor records in input order.
		void overlay(variant_source &donor);
		
		donor_outcome add_donor_variant(variant_record const &donor_rec);
		donor_outcome update_overlapping_variant(interval_entry const &existing_entry, variant_record const &incoming);
		
		interval_map const &variant_map() const { return m_map; }
		interval_map &variant_map() { return m_map; }
		interval_map take_variant_map() { return std::move(m_map); }
		overlay_statistics const &statistics() const { return m_statistics; }
		
	protected:
		donor_outcome replace_single_position_variant(interval_entry const &existing_entry, variant_record const &incoming);
		void replace_with_split(interval_entry const &existing_entry, variant_record const &incoming);
	};
	
	
	struct overlay_result
	{
		std::string			sample_name;
		interval_map		map;
		overlay_statistics	statistics;
	};
	
	
	overlay_result overlay(variant_source &base, variant_source &donor, overlay_delegate *delegate = nullptr);
	
	
	std::ostream &operator<<(std::ostream &os, donor_outcome const outcome);
	std::ostream &operator<<(std::ostream &os, overlay_statistics const &stats);
}

#endif
