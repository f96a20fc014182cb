#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/pytypes.h>
#include <pybind11/stl.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "shor/oracle.hpp"
#include "shor/shor.hpp"

namespace py = pybind11;

namespace {

// Python exception types, filled in by PYBIND11_MODULE (owned by the module).
py::handle g_backend_unavailable;
py::handle g_no_result;

// Adapts a Python callable (n, a) -> r to the PeriodOracle interface, so a
// Python quantum SDK can serve as the backend.
class PyOracle : public shor::PeriodOracle {
public:
  explicit PyOracle(py::function fn) : fn_(std::move(fn)) {}

  std::uint64_t find_period(std::uint64_t n, std::uint64_t a) override {
    py::gil_scoped_acquire gil;
    try {
      return fn_(n, a).cast<std::uint64_t>();
    } catch (py::error_already_set& e) {
      // Map the module's own exception types back to C++ so the driver
      // retries; anything else propagates to the caller.
      if (e.matches(g_backend_unavailable))
        throw shor::BackendUnavailable(e.what());
      if (e.matches(g_no_result))
        throw shor::NoResult(e.what());
      throw;
    }
  }

private:
  py::function fn_;
};

std::unique_ptr<shor::PeriodOracle>
make_oracle(std::optional<py::function> oracle) {
  if (oracle.has_value())
    return std::make_unique<PyOracle>(*oracle);
  return std::make_unique<shor::ClassicalPeriodOracle>();
}

py::dict attempt_to_dict(const shor::Attempt& at) {
  py::dict d;
  d["index"] = at.index;
  d["base"] = py::int_(at.base);
  d["period"] = py::int_(at.period);
  d["outcome"] = shor::to_string(at.outcome);
  d["detail"] = at.detail;
  return d;
}

std::optional<py::tuple> reduce_py(std::uint64_t n, std::uint64_t a,
                                   std::uint64_t r) {
  auto pair = shor::reduce(n, a, r);
  if (!pair)
    return std::nullopt;
  return py::make_tuple(pair->first, pair->second);
}

py::dict factor_py(std::uint64_t n, std::uint32_t max_attempts,
                   std::uint64_t seed,
                   std::optional<py::function> oracle = std::nullopt,
                   std::optional<py::function> callback = std::nullopt) {
  shor::FactorConfig cfg{n, max_attempts, seed,
                         /*enable_progress=*/callback.has_value()};

  // Prepare C++ attempt callback that reacquires the GIL when invoked.
  shor::AttemptCb cb_cpp;
  if (callback.has_value()) {
    py::function fn = *callback;
    cb_cpp = [fn = std::move(fn)](const shor::Attempt& at) {
      py::gil_scoped_acquire gil;
      fn(attempt_to_dict(at));
    };
  }

  auto backend = make_oracle(std::move(oracle));
  shor::FactorResult res;
  {
    py::gil_scoped_release nogil;
    res = shor::factor(cfg, *backend, cb_cpp);
  }

  py::dict out;
  out["n"] = py::int_(res.n);
  out["factors"] = py::make_tuple(res.factors.first, res.factors.second);
  out["attempts"] = res.attempts;
  out["base"] = py::int_(res.base);
  out["period"] = py::int_(res.period);
  out["via_gcd"] = res.via_gcd;
  out["ns_elapsed"] = py::int_(res.ns_elapsed);
  out["engine_info"] = res.engine_info;
  return out;
}

std::vector<std::uint64_t>
factorize_py(std::uint64_t n, std::uint32_t max_attempts, std::uint64_t seed,
             std::optional<py::function> oracle = std::nullopt) {
  auto backend = make_oracle(std::move(oracle));
  py::gil_scoped_release nogil;
  return shor::factorize(n, *backend, max_attempts, seed);
}

} // namespace

PYBIND11_MODULE(shorcore, m) {
  m.doc() = "Classical post-processing for Shor's factoring algorithm (pybind11)";
  m.attr("__version__") = shor::SHOR_VERSION;

  py::register_exception<shor::InvalidInput>(m, "InvalidInput",
                                             PyExc_ValueError);
  py::register_exception<shor::Exhausted>(m, "Exhausted", PyExc_RuntimeError);
  auto& oracle_error = py::register_exception<shor::OracleError>(
      m, "OracleError", PyExc_RuntimeError);
  auto& backend_unavailable = py::register_exception<shor::BackendUnavailable>(
      m, "BackendUnavailable", oracle_error.ptr());
  auto& no_result = py::register_exception<shor::NoResult>(
      m, "NoResult", oracle_error.ptr());
  g_backend_unavailable = backend_unavailable;
  g_no_result = no_result;

  m.def("reduce", &reduce_py, py::arg("n"), py::arg("a"), py::arg("r"),
        R"pbdoc(Turn a period r of a mod n into (f1, n // f1), or None.)pbdoc");

  m.def("factor", &factor_py,
      py::arg("n"),
      py::arg("max_attempts") = 16,
      py::arg("seed") = 0,                    // 0 => std::random_device
      py::arg("oracle") = py::none(),
      py::arg("callback") = py::none(),
      R"pbdoc(
Split n into two nontrivial factors.

Args:
  n (int): composite modulus, not a prime power.
  max_attempts (int): random bases tried before raising Exhausted.
  seed (int): base-selection seed; 0 for a random seed.
  oracle (callable): optional (n:int, a:int) -> period:int. It may raise
    BackendUnavailable or NoResult to have the attempt retried. Defaults to
    classical order finding.
  callback (callable): optional function (attempt:dict) -> None.

Returns:
  dict { n, factors, attempts, base, period, via_gcd, ns_elapsed, engine_info }.
)pbdoc");

  m.def("factorize", &factorize_py,
        py::arg("n"), py::arg("max_attempts") = 16, py::arg("seed") = 0,
        py::arg("oracle") = py::none(),
        R"pbdoc(Prime factors of n in ascending order, with multiplicity.)pbdoc");
}
