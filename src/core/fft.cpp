/// @file fft.cpp
/// @brief Implementation of FFT wrapper.

#include "core/fft.h"

#include <stdexcept>

#include "util/exception.h"

extern "C" {
#include "kiss_fft.h"
#include "kiss_fftr.h"
}

namespace keyscope {

struct FFT::Impl {
  kiss_fftr_cfg forward_cfg;

  explicit Impl(int n_fft) {
    forward_cfg = kiss_fftr_alloc(n_fft, 0, nullptr, nullptr);
    if (!forward_cfg) {
      throw std::runtime_error("Failed to allocate KissFFT config");
    }
  }

  ~Impl() {
    if (forward_cfg) kiss_fft_free(forward_cfg);
  }
};

namespace {

// kiss_fftr only supports even sizes
int checked_size(int n_fft) {
  KEYSCOPE_CHECK_MSG(n_fft > 0 && n_fft % 2 == 0, ErrorCode::InvalidParameter,
                     "FFT size must be positive and even");
  return n_fft;
}

}  // namespace

FFT::FFT(int n_fft)
    : n_fft_(checked_size(n_fft)),
      scratch_(static_cast<size_t>(n_fft / 2 + 1)),
      impl_(std::make_unique<Impl>(n_fft)) {}

FFT::~FFT() = default;

FFT::FFT(FFT&&) noexcept = default;
FFT& FFT::operator=(FFT&&) noexcept = default;

void FFT::forward(const float* input, std::complex<float>* output) {
  kiss_fftr(impl_->forward_cfg, input, reinterpret_cast<kiss_fft_cpx*>(output));
}

void FFT::magnitude(const float* input, float* magnitude) {
  forward(input, scratch_.data());
  for (size_t k = 0; k < scratch_.size(); ++k) {
    magnitude[k] = std::abs(scratch_[k]);
  }
}

}  // namespace keyscope
