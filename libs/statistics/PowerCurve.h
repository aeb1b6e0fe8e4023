// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __POWER_CURVE_H
#define __POWER_CURVE_H 1

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>
#include "FrequentistTestConfiguration.h"

namespace abvalidator
{
  /**
   * @class PowerPoint
   * @brief One (effect size, power) sample of a power curve.
   */
  class PowerPoint
  {
  public:
    PowerPoint(double effectSize, double power)
      : mEffectSize(effectSize),
	mPower(power)
    {}

    double getEffectSize() const
    {
      return mEffectSize;
    }

    double getPower() const
    {
      return mPower;
    }

  private:
    double mEffectSize;
    double mPower;
  };

  /**
   * @class PowerCurve
   * @brief Statistical power of a two-proportion z-test over a grid of
   *        hypothesised effect sizes, assuming the control proportion is true.
   *
   * For an effect size e:
   *
   *     se      = sqrt(p0 * (1 - p0) * (1/n0 + 1/n1))
   *     z_alpha = Phi^-1(1 - alpha/2)   (two tailed)
   *             = Phi^-1(1 - alpha)     (one tailed)
   *     power   = 1 - Phi(z_alpha - e/se)
   *
   * The curve is a lazy, finite, restartable range: points are computed when
   * an iterator is dereferenced, and every begin() starts a fresh pass.
   * When p0 is 0 or 1 the standard error is zero, every power value is NaN
   * and isDegenerate() is true.
   *
   * The observed effect (treatment proportion minus control proportion) is
   * carried along for report writers that mark it on the curve.
   */
  class PowerCurve
  {
  public:
    class const_iterator
    {
    public:
      using iterator_category = std::forward_iterator_tag;
      using value_type = PowerPoint;
      using difference_type = std::ptrdiff_t;
      using pointer = void;
      using reference = PowerPoint;

      const_iterator()
	: mCurve(nullptr),
	  mIndex(0)
      {}

      const_iterator(const PowerCurve* curve, std::size_t index)
	: mCurve(curve),
	  mIndex(index)
      {}

      PowerPoint operator*() const
      {
	return mCurve->pointAt(mIndex);
      }

      const_iterator& operator++()
      {
	++mIndex;
	return *this;
      }

      const_iterator operator++(int)
      {
	const_iterator previous(*this);
	++mIndex;
	return previous;
      }

      bool operator==(const const_iterator& rhs) const
      {
	return mCurve == rhs.mCurve && mIndex == rhs.mIndex;
      }

      bool operator!=(const const_iterator& rhs) const
      {
	return !(*this == rhs);
      }

    private:
      const PowerCurve* mCurve;
      std::size_t mIndex;
    };

    // 0.000, 0.005, ..., 0.195
    static std::vector<double> defaultEffectGrid();

    PowerCurve(double propNull,
	       uint64_t trialsNull,
	       uint64_t trialsAlt,
	       const FrequentistTestConfiguration& config,
	       double observedEffect = 0.0,
	       const std::vector<double>& effectGrid = defaultEffectGrid());

    double powerAt(double effectSize) const;

    PowerPoint pointAt(std::size_t index) const;

    const_iterator begin() const
    {
      return const_iterator(this, 0);
    }

    const_iterator end() const
    {
      return const_iterator(this, mEffectGrid.size());
    }

    std::size_t size() const
    {
      return mEffectGrid.size();
    }

    bool isDegenerate() const
    {
      return mStandardError == 0.0;
    }

    double getPropNull() const
    {
      return mPropNull;
    }

    double getStandardError() const
    {
      return mStandardError;
    }

    double getCriticalValue() const
    {
      return mCriticalValue;
    }

    double getObservedEffect() const
    {
      return mObservedEffect;
    }

    const std::vector<double>& getEffectGrid() const
    {
      return mEffectGrid;
    }

  private:
    double mPropNull;
    double mStandardError;
    double mCriticalValue;
    double mObservedEffect;
    std::vector<double> mEffectGrid;
  };
}

#endif
