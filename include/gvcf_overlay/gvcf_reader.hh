/*
 * Copyright (c) 2026 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef GVCF_OVERLAY_GVCF_READER_HH
#define GVCF_OVERLAY_GVCF_READER_HH

#include <gvcf_overlay/variant_source.hh>
#include <libbio/vcf/subfield.hh>
#include <libbio/vcf/variant.hh>
#include <libbio/vcf/vcf_reader.hh>
#include <memory>


namespace gvcf_overlay::detail {
	
	struct vcf_input
	{
		virtual ~vcf_input() {}
	};
}


namespace gvcf_overlay {
	
	// Assembly co-ordinates written by the assembly-to-GVCF conversion.
	using vcf_info_field_asm_chr	= libbio::vcf::info_field <libbio::vcf::metadata_value_type::STRING,	1>;
	using vcf_info_field_asm_start	= libbio::vcf::info_field <libbio::vcf::metadata_value_type::INTEGER,	1>;
	using vcf_info_field_asm_end	= libbio::vcf::info_field <libbio::vcf::metadata_value_type::INTEGER,	1>;
	using vcf_info_field_asm_strand	= libbio::vcf::info_field <libbio::vcf::metadata_value_type::STRING,	1>;
	
	
	// Reads GVCF records with libbio. Call open_variants_file() and prepare() before next_variant().
	// Since the libbio reader refers to the input, instances cannot be moved.
	class gvcf_reader final : public variant_source
	{
	protected:
		typedef std::unique_ptr <detail::vcf_input>	input_ptr;
		
	protected:
		input_ptr									m_vcf_input;
		libbio::vcf::reader							m_vcf_reader;
		libbio::vcf::reader::parser_state			m_parser_state;
		std::vector <std::string>					m_sample_names;
		libbio::vcf::info_field_end const			*m_end_field{};
		vcf_info_field_asm_chr const				*m_asm_chr_field{};
		vcf_info_field_asm_start const				*m_asm_start_field{};
		vcf_info_field_asm_end const				*m_asm_end_field{};
		vcf_info_field_asm_strand const				*m_asm_strand_field{};
		
	public:
		gvcf_reader() = default;
		gvcf_reader(gvcf_reader const &) = delete;
		gvcf_reader &operator=(gvcf_reader const &) = delete;
		
		// Files that end with “.gz” are decompressed while reading.
		void open_variants_file(char const *variant_file_path);
		void prepare();
		
		std::vector <std::string> const &sample_names() const override { return m_sample_names; }
		bool next_variant(variant_record &out_rec) override;
		
	protected:
		variant_record make_record(libbio::vcf::transient_variant const &var) const;
		assembly_annotation make_assembly_annotation(libbio::vcf::transient_variant const &var) const;
	};
}

#endif
