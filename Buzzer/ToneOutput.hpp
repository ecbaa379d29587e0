#ifndef TONEOUTPUT_HPP
#define TONEOUTPUT_HPP

class ToneOutput {
public:
    virtual ~ToneOutput() = default;

    // Drive a tone at freq Hz with duty in [0.0, 1.0]
    virtual bool start(int freq, float duty) = 0;
    virtual void stop() = 0;
};

#endif // TONEOUTPUT_HPP
