#include "markov/config.hh"
#include "markov/corpus.hh"
#include "markov/model.hh"
#include "markov/random_source.hh"
#include "markov/sample.hh"
#include "util/exception.hh"

#include <boost/program_options.hpp>

#include <ctime>
#include <fstream>
#include <iostream>
#include <string>

namespace {
class OrderNotify {
  public:
    OrderNotify(std::size_t &out) : behind_(out) {}

    void operator()(const std::string &from) {
      behind_ = markov::ParseOrder(from);
    }

  private:
    std::size_t &behind_;
};

} // namespace

int main(int argc, char *argv[]) {
  try {
    namespace po = boost::program_options;
    po::options_description options("Markov chain generation options");
    markov::DriverConfig config;

    options.add_options()
      ("help,h", po::bool_switch(), "Show this help message")
      ("order,o", po::value<std::string>()->notifier(OrderNotify(config.order))->required(), "Order of the model: tokens per n-gram, at least 2")
      ("text", po::value<std::string>(&config.text), "Read the corpus from a file instead of stdin")
      ("seed", po::value<uint32_t>(&config.seed)->default_value(0), "Random seed.  0 seeds from the clock")
      ("count,n", po::value<std::size_t>(&config.count)->default_value(1), "Number of sequences to generate")
      ("max_steps", po::value<std::size_t>(&config.walk.max_steps)->default_value(0), "Stop a walk after this many tokens.  0 walks until the terminal token")
      ("quiet,q", po::bool_switch(), "Do not print progress messages");
    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, options), vm);

    if (argc == 1 || vm["help"].as<bool>()) {
      std::cerr <<
        "Counts n-grams in a corpus and generates sentences by walking the counts as a\n"
        "Markov chain.\n\n"
        "Provide the corpus on stdin, one sentence per line with tokens separated by\n"
        "spaces.  Generated sentences are written to stdout, one per line.  Order of\n"
        "the model (-o) is the only mandatory option.\n\n";
      std::cerr << options << std::endl;
      return 1;
    }

    po::notify(vm);
    if (vm["quiet"].as<bool>()) config.walk.messages = NULL;
    markov::ValidateConfig(config);

    markov::Model model(config.order);
    if (config.text.empty()) {
      markov::ReadCorpus(std::cin, model, config.walk.messages);
    } else {
      std::ifstream in(config.text.c_str());
      UTIL_THROW_IF(!in, util::ErrnoException, "Could not open " << config.text << " for reading.");
      markov::ReadCorpus(in, model, config.walk.messages);
    }

    uint32_t seed = config.seed ? config.seed : static_cast<uint32_t>(std::time(NULL));
    if (config.walk.messages) *config.walk.messages << "Seed " << seed << std::endl;
    markov::MersenneSource random(seed);

    const markov::Sequence begin(markov::BeginContext(model));
    for (std::size_t i = 0; i < config.count; ++i) {
      std::cout << markov::JoinSentence(markov::RandomSequence(model, begin, random, config.walk)) << '\n';
    }
    std::cout.flush();
  } catch (const std::exception &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  return 0;
}
