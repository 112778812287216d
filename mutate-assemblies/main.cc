/*
 * Copyright (c) 2026 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <cstdlib>
#include <gvcf_overlay/gvcf_reader.hh>
#include <gvcf_overlay/gvcf_writer.hh>
#include <gvcf_overlay/overlay_engine.hh>
#include <gvcf_overlay/overlay_logger.hh>
#include <gvcf_overlay/utility/log_assertion_failure.hh>
#include <iostream>
#include <libbio/utility/misc.hh>
#include "cmdline.h"


namespace gv	= gvcf_overlay;
namespace lb	= libbio;


namespace {
	
	void mutate_assemblies(gengetopt_args_info const &args_info)
	{
		gv::overlay_logger logger;
		if (args_info.log_given)
			logger.open_log_file(args_info.log_arg, args_info.overwrite_flag);
		
		gv::overlay_engine engine(&logger);
		
		// Read the founder variants.
		std::string sample_name;
		{
			lb::log_time(std::cerr) << "Reading the founder variants from " << args_info.founder_gvcf_arg << "…" << std::flush;
			gv::gvcf_reader reader;
			reader.open_variants_file(args_info.founder_gvcf_arg);
			reader.prepare();
			sample_name = engine.build(reader);
			std::cerr << " Done. Sample: " << sample_name << " records: " << engine.variant_map().size() << ".\n";
		}
		
		// Add the donor variants.
		{
			lb::log_time(std::cerr) << "Adding the variants from " << args_info.donor_gvcf_arg << "…" << std::flush;
			gv::gvcf_reader reader;
			reader.open_variants_file(args_info.donor_gvcf_arg);
			reader.prepare();
			engine.overlay(reader);
			std::cerr << " Done.\n";
		}
		
		// Output.
		{
			lb::log_time(std::cerr) << "Writing the mutated variants…" << std::flush;
			auto const output_path(gv::write_mutated_gvcf(args_info.output_dir_arg, sample_name, engine.variant_map(), args_info.overwrite_flag));
			std::cerr << " Done. Wrote " << output_path.native() << ".\n";
		}
		
		logger.flush();
		
		auto const &stats(engine.statistics());
		lb::log_time(std::cerr) << "Statistics: " << stats << '\n';
		if (stats.indel_overlaps_skipped || stats.unhandled_overlaps)
		{
			std::cerr << "WARNING: " << (stats.indel_overlaps_skipped + stats.unhandled_overlaps) << " donor variants overlapped the founder in a way that is not handled and were left out.";
			if (!args_info.log_given)
				std::cerr << " Use --log to list them.";
			std::cerr << '\n';
		}
	}
}


int main(int argc, char **argv)
{
#ifndef NDEBUG
	std::cerr << "Assertions have been enabled." << std::endl;
#endif
	
	gengetopt_args_info args_info;
	if (0 != cmdline_parser(argc, argv, &args_info))
		std::exit(EXIT_FAILURE);
	
	std::ios_base::sync_with_stdio(false);	// Don't use C style IO after calling cmdline_parser.
	std::cin.tie(nullptr);					// We don't require any input from the user.
	
	if (args_info.show_invocation_given)
	{
		std::cerr << "Invocation:";
		for (int i(0); i < argc; ++i)
			std::cerr << ' ' << argv[i];
		std::cerr << '\n';
	}
	
	try
	{
		mutate_assemblies(args_info);
	}
	catch (lb::assertion_failure_exception const &exc)
	{
		std::cerr << '\n';
		gv::log_assertion_failure_exception(std::cerr, exc);
		cmdline_parser_free(&args_info);
		return EXIT_FAILURE;
	}
	catch (gv::configuration_error const &exc)
	{
		std::cerr << "\nERROR: " << exc.what() << '\n';
		cmdline_parser_free(&args_info);
		return EXIT_FAILURE;
	}
	catch (std::exception const &exc)
	{
		std::cerr << '\n';
		gv::log_exception(std::cerr, exc);
		cmdline_parser_free(&args_info);
		return EXIT_FAILURE;
	}
	
	cmdline_parser_free(&args_info);
	return EXIT_SUCCESS;
}
