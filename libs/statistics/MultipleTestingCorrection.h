// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __MULTIPLE_TESTING_CORRECTION_H
#define __MULTIPLE_TESTING_CORRECTION_H 1

#include <algorithm>
#include <cstddef>
#include <string>
#include <tuple>
#include <utility>
#include <vector>
#include "AbTestException.h"

namespace abvalidator
{
  //===========================================================================
  // Internal helper functions in the detail namespace.
  //===========================================================================
  namespace detail
  {
    // (p-value, position in the caller's input)
    typedef std::tuple<double, std::size_t> RankedPValue;

    // Sorts the p-values ascending. Ties keep their input order so that the
    // adjusted values map back deterministically.
    std::vector<RankedPValue> rankPValues(const std::vector<double>& pValues);

    // Step-wise adjustment of p-values already sorted ascending.
    //
    //   computeCandidate(p, i, m): the scaled p-value of the i-th smallest
    //                              (0-based) of m p-values.
    //   updateMono(previous, candidate): combines the candidate with the
    //                              adjusted value of the previous rank visited.
    //   reverseOrder: true walks from the largest p-value down (step-up
    //                 procedures such as Benjamini-Hochberg), false walks from
    //                 the smallest up (step-down procedures such as Holm).
    //
    // Every adjusted value is capped at 1 before monotonicity is enforced and
    // written back into element 0 of its tuple.
    template <typename FactorFunc, typename MonoFunc>
    void adjustPValues(std::vector<RankedPValue>& container,
		       FactorFunc computeCandidate,
		       MonoFunc updateMono,
		       bool reverseOrder)
    {
      const std::size_t totalTests = container.size();
      if (totalTests == 0)
	return;

      double previousAdjusted = 0.0;

      if (reverseOrder)
	{
	  for (std::size_t k = totalTests; k-- > 0; )
	    {
	      double candidate = std::min(1.0, computeCandidate(std::get<0>(container[k]),
								k, totalTests));
	      double adjusted = (k == totalTests - 1) ?
		candidate : updateMono(previousAdjusted, candidate);

	      previousAdjusted = adjusted;
	      std::get<0>(container[k]) = adjusted;
	    }
	}
      else
	{
	  for (std::size_t k = 0; k < totalTests; ++k)
	    {
	      double candidate = std::min(1.0, computeCandidate(std::get<0>(container[k]),
								k, totalTests));
	      double adjusted = (k == 0) ? candidate : updateMono(previousAdjusted, candidate);

	      previousAdjusted = adjusted;
	      std::get<0>(container[k]) = adjusted;
	    }
	}
    }

    // Writes the adjusted values back into input order.
    std::vector<double> restoreInputOrder(const std::vector<RankedPValue>& adjusted);
  }

  enum class CorrectionMethod
  {
    Bonferroni,
    Holm,
    BenjaminiHochberg
  };

  // "bonferroni", "holm" and "fdr_bh", case-insensitive.
  CorrectionMethod correctionMethodFromString(const std::string& name);

  std::string correctionMethodToString(CorrectionMethod method);

  //===========================================================================
  // Policy: BonferroniCorrection
  //
  // Controls the family-wise error rate: p * m, capped at 1.
  //===========================================================================
  class BonferroniCorrection
  {
  public:
    static std::vector<double> adjust(const std::vector<double>& pValues);
  };

  //===========================================================================
  // Policy: HolmCorrection
  //
  // Holm-Bonferroni step-down. The k-th smallest p-value (1-based) is scaled
  // by (m - k + 1); adjusted values are made non-decreasing in the order of
  // the raw p-values by a running maximum from the smallest upward.
  //===========================================================================
  class HolmCorrection
  {
  public:
    static std::vector<double> adjust(const std::vector<double>& pValues);
  };

  //===========================================================================
  // Policy: BenjaminiHochbergCorrection
  //
  // Controls the false discovery rate. The k-th smallest p-value (1-based) is
  // scaled by m / k; a running minimum from the largest p-value downward makes
  // the adjusted values non-decreasing in the order of the raw p-values.
  //===========================================================================
  class BenjaminiHochbergCorrection
  {
  public:
    static std::vector<double> adjust(const std::vector<double>& pValues);
  };

  /**
   * @class CorrectionResult
   * @brief A raw p-value and its corrected counterpart, for one named group.
   */
  class CorrectionResult
  {
  public:
    CorrectionResult(const std::string& groupName, double originalPValue, double correctedPValue)
      : mGroupName(groupName),
	mOriginalPValue(originalPValue),
	mCorrectedPValue(correctedPValue)
    {}

    const std::string& getGroupName() const
    {
      return mGroupName;
    }

    double getOriginalPValue() const
    {
      return mOriginalPValue;
    }

    double getCorrectedPValue() const
    {
      return mCorrectedPValue;
    }

    bool isSignificant(double alpha) const
    {
      return mCorrectedPValue < alpha;
    }

  private:
    std::string mGroupName;
    double mOriginalPValue;
    double mCorrectedPValue;
  };

  /**
   * @class MultipleTestingCorrection
   * @brief Adjusts a family of p-values for multiple comparisons.
   *
   * Output has the cardinality and order of the input. Every p-value must be
   * a number in [0, 1]; anything else throws InvalidPValueException. An empty
   * family yields an empty result and a family of one is returned unchanged.
   */
  class MultipleTestingCorrection
  {
  public:
    static std::vector<double> correct(const std::vector<double>& pValues,
				       CorrectionMethod method);

    static std::vector<CorrectionResult>
    correct(const std::vector<std::pair<std::string, double>>& namedPValues,
	    CorrectionMethod method);

    static void validatePValues(const std::vector<double>& pValues);
  };
}

#endif
