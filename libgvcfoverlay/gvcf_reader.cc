/*
 * Copyright (c) 2026 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <gvcf_overlay/gvcf_reader.hh>
#include <libbio/assert.hh>
#include <libbio/file_handling.hh>
#include <string_view>

namespace io	= boost::iostreams;
namespace lb	= libbio;
namespace vcf	= libbio::vcf;
namespace gv	= gvcf_overlay;


namespace {
	
	struct vcf_mmap_input final : public gv::detail::vcf_input
	{
		vcf::mmap_input	input{};
	};
	
	
	struct vcf_compressed_stream_input final : public gv::detail::vcf_input
	{
		typedef vcf::stream_input <
			io::filtering_stream <io::input>
		> filtering_stream_input;
		
		filtering_stream_input	input;
		lb::file_istream		compressed_input_stream;
	};
	
	
	template <typename t_field>
	t_field const *find_info_field(vcf::reader &reader, char const *identifier)
	{
		auto const &fields(reader.info_fields());
		auto const it(fields.find(identifier));
		libbio_always_assert_msg(fields.end() != it, "Unable to find the INFO field ", identifier);
		auto const *retval(dynamic_cast <t_field const *>(it->second.get()));
		libbio_always_assert_msg(retval, "Unexpected type for the INFO field ", identifier);
		
		// Fields not declared in the header have no values.
		if (!retval->get_metadata())
			return nullptr;
		
		return retval;
	}
	
	
	template <typename t_field, typename t_dst>
	inline void copy_info_value(t_field const *field, vcf::transient_variant const &var, t_dst &dst)
	{
		if (field && field->has_value(var))
			dst = (*field)(var);
	}
}


namespace gvcf_overlay {
	
	void gvcf_reader::open_variants_file(char const *variant_file_path)
	{
		std::string_view const sv(variant_file_path);
		if (sv.ends_with(".gz"))
		{
			auto ptr(std::make_unique <vcf_compressed_stream_input>());
			lb::open_file_for_reading(variant_file_path, ptr->compressed_input_stream);
			
			auto &filtering_stream(ptr->input.stream());
			filtering_stream.push(io::gzip_decompressor());
			filtering_stream.push(ptr->compressed_input_stream);
			filtering_stream.exceptions(std::istream::badbit);
			
			m_vcf_reader.set_input(ptr->input);
			m_vcf_input = std::move(ptr);
		}
		else
		{
			auto ptr(std::make_unique <vcf_mmap_input>());
			ptr->input.handle().open(variant_file_path);
			
			m_vcf_reader.set_input(ptr->input);
			m_vcf_input = std::move(ptr);
		}
	}
	
	
	void gvcf_reader::prepare()
	{
		libbio_always_assert_msg(m_vcf_input, "open_variants_file() needs to be called before prepare()");
		
		{
			// Only END and the assembly co-ordinates are needed from INFO; the remaining
			// fields are handled as declared in the header.
			auto &info_fields(m_vcf_reader.info_fields());
			vcf::add_subfield <vcf::info_field_end>			(info_fields, "END");
			vcf::add_subfield <vcf_info_field_asm_chr>		(info_fields, "ASM_Chr");
			vcf::add_subfield <vcf_info_field_asm_start>	(info_fields, "ASM_Start");
			vcf::add_subfield <vcf_info_field_asm_end>		(info_fields, "ASM_End");
			vcf::add_subfield <vcf_info_field_asm_strand>	(info_fields, "ASM_Strand");
		}
		
		m_vcf_reader.read_header();
		
		m_end_field = m_vcf_reader.get_end_field_ptr();
		m_asm_chr_field = find_info_field <vcf_info_field_asm_chr>(m_vcf_reader, "ASM_Chr");
		m_asm_start_field = find_info_field <vcf_info_field_asm_start>(m_vcf_reader, "ASM_Start");
		m_asm_end_field = find_info_field <vcf_info_field_asm_end>(m_vcf_reader, "ASM_End");
		m_asm_strand_field = find_info_field <vcf_info_field_asm_strand>(m_vcf_reader, "ASM_Strand");
		
		// The reader numbers the samples from one.
		{
			auto const &sample_names(m_vcf_reader.sample_names());
			m_sample_names.clear();
			m_sample_names.resize(sample_names.size());
			for (auto const &kv : sample_names)
			{
				auto const sample_no(kv.second);
				libbio_always_assert_lt(0, sample_no);
				libbio_always_assert_lte(sample_no, m_sample_names.size());
				m_sample_names[sample_no - 1] = kv.first;
			}
		}
		
		m_vcf_reader.reset();
		m_vcf_reader.set_parsed_fields(vcf::field::INFO);
	}
	
	
	assembly_annotation gvcf_reader::make_assembly_annotation(vcf::transient_variant const &var) const
	{
		assembly_annotation retval;
		
		{
			std::string_view chr;
			copy_info_value(m_asm_chr_field, var, chr);
			if (!chr.empty())
				retval.chr = std::string(chr);
		}
		
		{
			std::string_view strand;
			copy_info_value(m_asm_strand_field, var, strand);
			if (!strand.empty())
				retval.strand = std::string(strand);
		}
		
		copy_info_value(m_asm_start_field, var, retval.start);
		copy_info_value(m_asm_end_field, var, retval.end);
		return retval;
	}
	
	
	variant_record gvcf_reader::make_record(vcf::transient_variant const &var) const
	{
		// Not reached on EOF.
		libbio_assert(m_end_field);
		
		std::string alt;
		{
			bool is_first(true);
			for (auto const &var_alt : var.alts())
			{
				if (!is_first)
					alt += ',';
				alt += var_alt.alt;
				is_first = false;
			}
		}
		
		// variant_end_pos() returns a zero-based past-the-end position, i.e. the 1-based last position.
		auto const end_pos(lb::variant_end_pos(var, *m_end_field));
		variant_record const rec(
			std::string(var.chrom_id()),
			var.pos(),
			end_pos,
			std::string(var.ref()),
			std::move(alt)
		);
		
		auto retval(rec.with_lineno(var.lineno()));
		auto assembly(make_assembly_annotation(var));
		if (!assembly.empty())
			return retval.with_assembly(std::move(assembly));
		
		return retval;
	}
	
	
	bool gvcf_reader::next_variant(variant_record &out_rec)
	{
		bool retval(false);
		m_vcf_reader.parse_one([this, &retval, &out_rec](vcf::transient_variant const &var) {
			out_rec = make_record(var);
			retval = true;
			return true;
		}, m_parser_state);
		
		return retval;
	}
}
