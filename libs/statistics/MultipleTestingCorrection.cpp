// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "MultipleTestingCorrection.h"
#include <cmath>
#include <boost/algorithm/string.hpp>

namespace abvalidator
{
  namespace detail
  {
    std::vector<RankedPValue> rankPValues(const std::vector<double>& pValues)
    {
      std::vector<RankedPValue> ranked;
      ranked.reserve(pValues.size());
      for (std::size_t i = 0; i < pValues.size(); ++i)
	ranked.emplace_back(pValues[i], i);

      std::stable_sort(ranked.begin(), ranked.end(),
		       [](const RankedPValue& a, const RankedPValue& b) {
			 return std::get<0>(a) < std::get<0>(b);
		       });
      return ranked;
    }

    std::vector<double> restoreInputOrder(const std::vector<RankedPValue>& adjusted)
    {
      std::vector<double> result(adjusted.size());
      for (const auto& entry : adjusted)
	result[std::get<1>(entry)] = std::get<0>(entry);

      return result;
    }
  }

  CorrectionMethod correctionMethodFromString(const std::string& name)
  {
    const std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));

    if (key == "bonferroni")
      return CorrectionMethod::Bonferroni;
    else if (key == "holm")
      return CorrectionMethod::Holm;
    else if (key == "fdr_bh")
      return CorrectionMethod::BenjaminiHochberg;
    else
      throw UnsupportedCorrectionMethodException("Unsupported correction method '" + name +
						 "': expected bonferroni, holm or fdr_bh");
  }

  std::string correctionMethodToString(CorrectionMethod method)
  {
    switch (method)
      {
      case CorrectionMethod::Bonferroni:
	return "bonferroni";
      case CorrectionMethod::Holm:
	return "holm";
      case CorrectionMethod::BenjaminiHochberg:
	return "fdr_bh";
      }

    throw UnsupportedCorrectionMethodException("correctionMethodToString: unknown method");
  }

  std::vector<double> BonferroniCorrection::adjust(const std::vector<double>& pValues)
  {
    const double m = static_cast<double>(pValues.size());

    std::vector<double> adjusted;
    adjusted.reserve(pValues.size());
    for (double p : pValues)
      adjusted.push_back(std::min(1.0, p * m));

    return adjusted;
  }

  std::vector<double> HolmCorrection::adjust(const std::vector<double>& pValues)
  {
    auto ranked = detail::rankPValues(pValues);

    detail::adjustPValues(ranked,
			  [](double p, std::size_t k, std::size_t m) {
			    return p * static_cast<double>(m - k);
			  },
			  [](double previous, double candidate) {
			    return std::max(previous, candidate);
			  },
			  false);

    return detail::restoreInputOrder(ranked);
  }

  std::vector<double> BenjaminiHochbergCorrection::adjust(const std::vector<double>& pValues)
  {
    auto ranked = detail::rankPValues(pValues);

    detail::adjustPValues(ranked,
			  [](double p, std::size_t k, std::size_t m) {
			    return p * static_cast<double>(m) / static_cast<double>(k + 1);
			  },
			  [](double previous, double candidate) {
			    return std::min(previous, candidate);
			  },
			  true);

    return detail::restoreInputOrder(ranked);
  }

  void MultipleTestingCorrection::validatePValues(const std::vector<double>& pValues)
  {
    for (std::size_t i = 0; i < pValues.size(); ++i)
      {
	const double p = pValues[i];
	if (std::isnan(p) || p < 0.0 || p > 1.0)
	  throw InvalidPValueException("p-value at position " + std::to_string(i) +
				       " is not in [0, 1]: " + std::to_string(p));
      }
  }

  std::vector<double> MultipleTestingCorrection::correct(const std::vector<double>& pValues,
							 CorrectionMethod method)
  {
    validatePValues(pValues);

    switch (method)
      {
      case CorrectionMethod::Bonferroni:
	return BonferroniCorrection::adjust(pValues);
      case CorrectionMethod::Holm:
	return HolmCorrection::adjust(pValues);
      case CorrectionMethod::BenjaminiHochberg:
	return BenjaminiHochbergCorrection::adjust(pValues);
      }

    throw UnsupportedCorrectionMethodException("MultipleTestingCorrection: unknown method");
  }

  std::vector<CorrectionResult>
  MultipleTestingCorrection::correct(const std::vector<std::pair<std::string, double>>& namedPValues,
				     CorrectionMethod method)
  {
    std::vector<double> pValues;
    pValues.reserve(namedPValues.size());
    for (const auto& named : namedPValues)
      pValues.push_back(named.second);

    const std::vector<double> corrected = correct(pValues, method);

    std::vector<CorrectionResult> results;
    results.reserve(namedPValues.size());
    for (std::size_t i = 0; i < namedPValues.size(); ++i)
      results.emplace_back(namedPValues[i].first, namedPValues[i].second, corrected[i]);

    return results;
  }
}
