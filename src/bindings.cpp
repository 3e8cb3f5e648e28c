/**
 * @file bindings.cpp
 * @brief Python bindings for the rational arithmetic coder.
 */

#include "arithmetic_coder.hpp"
#include "dirichlet_model.hpp"
#include "ratcode_errors.hpp"
#include "static_model.hpp"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <map>
#include <string>

namespace py = pybind11;

namespace {

// Python callers pass {"a": 1, ...}; every key must be a single character
std::map<Symbol, int64_t> to_counts(const std::map<std::string, int64_t> &counts) {
  std::map<Symbol, int64_t> result;
  for (const auto &[key, count] : counts) {
    if (key.size() != 1) {
      throw InvalidPriorError("Symbols must be single characters, got '" + key + "'");
    }
    result[key[0]] = count;
  }
  return result;
}

} // namespace

PYBIND11_MODULE(ratcode, m) {
  m.doc() = "Exact rational arithmetic coder";

  py::register_exception<UnknownSymbolError>(m, "UnknownSymbolError", PyExc_ValueError);
  py::register_exception<InvalidPriorError>(m, "InvalidPriorError", PyExc_ValueError);
  py::register_exception<PrecisionOverflowError>(m, "PrecisionOverflowError", PyExc_OverflowError);

  py::class_<ProbabilityModel>(m, "ProbabilityModel");

  py::class_<DirichletModel, ProbabilityModel>(m, "DirichletModel")
      .def(py::init([](const std::map<std::string, int64_t> &priors) {
             return DirichletModel(to_counts(priors));
           }),
           py::arg("prior_counts"))
      .def("probabilities",
           [](const DirichletModel &self, const std::string &history) {
             // Exact probabilities as (numerator, denominator) string pairs
             Distribution d = self.predict(history);
             std::map<std::string, std::pair<std::string, std::string>> result;
             for (Symbol s : self.alphabet().symbols()) {
               const Rational &p = d.probability(s);
               result[std::string(1, s)] = {p.get_num().get_str(), p.get_den().get_str()};
             }
             return result;
           },
           "P(x | history) for every symbol x.\n", py::arg("history") = "");

  py::class_<StaticModel, ProbabilityModel>(m, "StaticModel")
      .def(py::init([](const std::map<std::string, int64_t> &weights) {
             return StaticModel(to_counts(weights));
           }),
           py::arg("weights"));

  // --- ENCODE ---
  // The code is returned in its text form ("0101...")
  m.def(
      "encode",
      [](const ProbabilityModel &model, const std::string &stream, size_t max_code_bits) {
        EncoderOptions options;
        options.max_code_bits = max_code_bits;
        return bit_code_to_string(encode(model, stream, options));
      },
      "Arithmetically encode a string of symbols.\n", py::arg("model"), py::arg("stream"),
      py::arg("max_code_bits") = 0);

  // --- DECODE ---
  m.def(
      "decode",
      [](const ProbabilityModel &model, const std::string &code, size_t num_symbols) {
        return decode(model, bit_code_from_string(code), num_symbols);
      },
      "Decode num_symbols symbols from a code string.\n", py::arg("model"), py::arg("code"),
      py::arg("num_symbols"));
}
