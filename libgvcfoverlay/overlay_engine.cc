/*
 * Copyright (c) 2026 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <boost/format.hpp>
#include <gvcf_overlay/overlay_engine.hh>
#include <libbio/assert.hh>
#include <optional>


namespace gvcf_overlay {
	
	void overlay_statistics::count(donor_outcome const outcome)
	{
		switch (outcome)
		{
			case donor_outcome::INSERTED:
				++inserted_variants;
				break;
				
			case donor_outcome::IDENTICAL:
				++identical_variants;
				break;
				
			case donor_outcome::REPLACED:
				++replaced_variants;
				break;
				
			case donor_outcome::SPLIT:
				++split_reference_blocks;
				break;
				
			case donor_outcome::REFERENCE_BLOCK_SKIPPED:
				++reference_blocks_skipped;
				break;
				
			case donor_outcome::MISSING_ALT_SKIPPED:
				++missing_alt_skipped;
				break;
				
			case donor_outcome::INDEL_OVERLAP_SKIPPED:
				++indel_overlaps_skipped;
				break;
				
			case donor_outcome::UNHANDLED_OVERLAP:
				++unhandled_overlaps;
				break;
		}
	}
	
	
	std::vector <variant_record> split_reference_block(variant_record const &block, variant_record const &incoming)
	{
		libbio_always_assert_msg(
			block.contig() == incoming.contig() && block.start() <= incoming.start() && incoming.end() <= block.end(),
			"Variant to add (", incoming.range(), ") must be contained in the reference block (", block.range(), ")"
		);
		
		std::vector <variant_record> retval;
		retval.reserve(3);
		
		if (block.start() < incoming.start())
			retval.emplace_back(make_reference_block(block.contig(), block.start(), incoming.start() - 1, block.ref()));
		
		retval.emplace_back(incoming);
		
		if (incoming.end() < block.end())
			retval.emplace_back(make_reference_block(block.contig(), incoming.end() + 1, block.end(), block.ref()));
		
		return retval;
	}
	
	
	std::string overlay_engine::build(variant_source &base)
	{
		auto const &sample_names(base.sample_names());
		if (sample_names.empty())
			throw configuration_error("The base variants do not declare a sample.");
		
		if (1 != sample_names.size())
			throw configuration_error(boost::str(boost::format("Expected the base variants to have exactly one sample, got %u.") % sample_names.size()));
		
		m_map.clear();
		m_statistics = overlay_statistics();
		
		variant_record rec;
		while (base.next_variant(rec))
		{
			m_map.put(rec.range(), rec);
			++m_statistics.base_records;
		}
		
		return sample_names.front();
	}
	
	
	void overlay_engine::overlay(variant_source &donor)
	{
		variant_record rec;
		while (donor.next_variant(rec))
			add_donor_variant(rec);
	}
	
	
	donor_outcome overlay_engine::add_donor_variant(variant_record const &donor_rec)
	{
		++m_statistics.donor_records;
		
		// Handle the outcome before returning.
		std::optional <variant_record> existing;
		auto const finish([this, &existing](variant_record const &incoming, donor_outcome const outcome){
			m_statistics.count(outcome);
			
			switch (outcome)
			{
				case donor_outcome::INSERTED:
				case donor_outcome::IDENTICAL:
				case donor_outcome::REPLACED:
				case donor_outcome::SPLIT:
				case donor_outcome::REFERENCE_BLOCK_SKIPPED:
					break;
					
				case donor_outcome::MISSING_ALT_SKIPPED:
				case donor_outcome::INDEL_OVERLAP_SKIPPED:
				case donor_outcome::UNHANDLED_OVERLAP:
					if (m_delegate)
						m_delegate->overlay_engine_skipped_variant(incoming, (existing ? &*existing : nullptr), outcome);
					break;
			}
			
			return outcome;
		});
		
		// Only the first ALT of the donor is used.
		auto const &alts(donor_rec.alt());
		auto const first_alt(alts.substr(0, alts.find(',')));
		if (first_alt.empty())
			return finish(donor_rec, donor_outcome::MISSING_ALT_SKIPPED);
		
		auto const current(
			variant_record(donor_rec.contig(), donor_rec.start(), donor_rec.end(), donor_rec.ref(), first_alt, true)
			.with_lineno(donor_rec.lineno())
			.with_assembly(donor_rec.assembly())
		);
		
		// Reference blocks do not change the sequence.
		if (current.is_reference_block())
			return finish(current, donor_outcome::REFERENCE_BLOCK_SKIPPED);
		
		auto const *entry_ptr(m_map.get_entry(current.start_position()));
		if (!entry_ptr)
		{
			auto const *intersecting_ptr(m_map.find_intersecting(current.range()));
			if (intersecting_ptr)
			{
				existing = intersecting_ptr->record;
				return finish(current, donor_outcome::UNHANDLED_OVERLAP);
			}
			
			m_map.put(current.range(), current);
			return finish(current, donor_outcome::INSERTED);
		}
		
		// Copy since the map is about to be modified.
		auto const entry(*entry_ptr);
		existing = entry.record;
		
		// Resolving the co-ordinates of overlapping indels is not supported.
		if (entry.record.is_indel() && current.is_indel())
			return finish(current, donor_outcome::INDEL_OVERLAP_SKIPPED);
		
		return finish(current, update_overlapping_variant(entry, current));
	}
	
	
	donor_outcome overlay_engine::update_overlapping_variant(interval_entry const &existing_entry, variant_record const &incoming)
	{
		auto const &existing(existing_entry.record);
		if (existing == incoming)
			return donor_outcome::IDENTICAL;
		
		if (existing.is_single_position())
			return replace_single_position_variant(existing_entry, incoming);
		
		switch (existing.kind())
		{
			case record_kind::REFERENCE_BLOCK:
			{
				// SNVs and insertions anchored to one reference character.
				if (1 == incoming.ref().size())
				{
					replace_with_split(existing_entry, incoming);
					return donor_outcome::SPLIT;
				}
				
				return donor_outcome::UNHANDLED_OVERLAP;
			}
				
			case record_kind::SNV:
			case record_kind::INDEL:
				return donor_outcome::UNHANDLED_OVERLAP;
		}
		
		return donor_outcome::UNHANDLED_OVERLAP;
	}
	
	
	donor_outcome overlay_engine::replace_single_position_variant(interval_entry const &existing_entry, variant_record const &incoming)
	{
		auto const &existing_range(existing_entry.range);
		libbio_always_assert_eq(existing_range.start, incoming.start());
		
		if (existing_range.end < incoming.end())
		{
			// The part of incoming past the replaced record has to be covered by one reference block,
			// which is then shortened from the left.
			auto const *next_ptr(m_map.get_entry(genomic_position(existing_range.contig, existing_range.end + 1)));
			if (! (next_ptr && next_ptr->record.is_reference_block() && incoming.end() <= next_ptr->range.end))
				return donor_outcome::UNHANDLED_OVERLAP;
			
			auto const next(*next_ptr);
			m_map.remove(next.range);
			if (incoming.end() < next.range.end)
			{
				auto const remainder(make_reference_block(next.range.contig, incoming.end() + 1, next.range.end, next.record.ref()));
				m_map.put(remainder.range(), remainder);
			}
		}
		
		m_map.remove(existing_range);
		m_map.put(incoming.range(), incoming);
		return donor_outcome::REPLACED;
	}
	
	
	void overlay_engine::replace_with_split(interval_entry const &existing_entry, variant_record const &incoming)
	{
		auto const parts(split_reference_block(existing_entry.record, incoming));
		m_map.remove(existing_entry.range);
		for (auto const &part : parts)
			m_map.put(part.range(), part);
	}
	
	
	overlay_result overlay(variant_source &base, variant_source &donor, overlay_delegate *delegate)
	{
		overlay_engine engine(delegate);
		overlay_result retval;
		retval.sample_name = engine.build(base);
		engine.overlay(donor);
		retval.statistics = engine.statistics();
		retval.map = engine.take_variant_map();
		return retval;
	}
	
	
	std::ostream &operator<<(std::ostream &os, donor_outcome const outcome)
	{
		switch (outcome)
		{
			case donor_outcome::INSERTED:
				os << "INSERTED";
				return os;
				
			case donor_outcome::IDENTICAL:
				os << "IDENTICAL";
				return os;
				
			case donor_outcome::REPLACED:
				os << "REPLACED";
				return os;
				
			case donor_outcome::SPLIT:
				os << "SPLIT";
				return os;
				
			case donor_outcome::REFERENCE_BLOCK_SKIPPED:
				os << "REFERENCE_BLOCK_SKIPPED";
				return os;
				
			case donor_outcome::MISSING_ALT_SKIPPED:
				os << "MISSING_ALT_SKIPPED";
				return os;
				
			case donor_outcome::INDEL_OVERLAP_SKIPPED:
				os << "INDEL_OVERLAP_SKIPPED";
				return os;
				
			case donor_outcome::UNHANDLED_OVERLAP:
				os << "UNHANDLED_OVERLAP";
				return os;
		}
		
		return os;
	}
	
	
	std::ostream &operator<<(std::ostream &os, overlay_statistics const &stats)
	{
		os
			<< "base records: " << stats.base_records
			<< " donor records: " << stats.donor_records
			<< " inserted: " << stats.inserted_variants
			<< " identical: " << stats.identical_variants
			<< " replaced: " << stats.replaced_variants
			<< " split reference blocks: " << stats.split_reference_blocks
			<< " skipped reference blocks: " << stats.reference_blocks_skipped
			<< " skipped (no ALT): " << stats.missing_alt_skipped
			<< " skipped indel overlaps: " << stats.indel_overlaps_skipped
			<< " unhandled overlaps: " << stats.unhandled_overlaps;
		return os;
	}
}
